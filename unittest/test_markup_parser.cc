//
// Unit tests for the glyph markup parser
//

#include <doctest/doctest.h>
#include <interlock/markup/markup_parser.hh>
#include <interlock/errors.hh>

TEST_SUITE("svg_markup_parser") {
    using namespace interlock;

    TEST_CASE("document root holds top-level elements") {
        svg_markup_parser parser;
        const auto doc = parser.parse(R"(<?xml version="1.0"?><!-- lead --><svg width="10"><path d="M0 0"/></svg>)");

        CHECK(doc.name == "#document");
        REQUIRE(doc.children.size() == 1);
        const auto& svg = doc.children[0];
        CHECK(svg.name == "svg");
        CHECK(svg.attribute("width") == "10");
        REQUIRE(svg.children.size() == 1);
        CHECK(svg.children[0].name == "path");
        CHECK(svg.children[0].attribute("d") == "M0 0");
    }

    TEST_CASE("attribute queries") {
        const auto doc = svg_markup_parser{}.parse(R"(<svg a='1' b = "two words"/>)");
        const auto* svg = doc.find_first("svg");
        REQUIRE(svg != nullptr);
        CHECK(svg->has_attribute("a"));
        CHECK(svg->attribute("b") == "two words");
        CHECK_FALSE(svg->attribute("c").has_value());
    }

    TEST_CASE("nested search and collection") {
        const auto doc = svg_markup_parser{}.parse(
            "<svg><g><path d='M1 1'/><g><path d='M2 2'/></g></g><rect/><path d='M3 3'/></svg>");

        std::vector<const markup_element*> paths;
        doc.collect("path", paths);
        REQUIRE(paths.size() == 3);
        CHECK(paths[0]->attribute("d") == "M1 1");
        CHECK(paths[1]->attribute("d") == "M2 2");
        CHECK(paths[2]->attribute("d") == "M3 3");

        CHECK(doc.find_first("rect") != nullptr);
        CHECK(doc.find_first("circle") == nullptr);
        CHECK(doc.find_first("svg")->descendant_count() == 6);
    }

    TEST_CASE("namespace prefixes are stripped") {
        const auto doc = svg_markup_parser{}.parse(
            R"(<svg:svg xmlns:svg="http://www.w3.org/2000/svg"><svg:path d="M0 0"/></svg:svg>)");
        const auto* svg = doc.find_first("svg");
        REQUIRE(svg != nullptr);
        CHECK(svg->find_first("path") != nullptr);
    }

    TEST_CASE("entities are decoded in attribute values") {
        const auto doc = svg_markup_parser{}.parse(R"(<t v="a &lt; b &amp;&amp; c &#65;&#x42; &unknown;"/>)");
        CHECK(doc.find_first("t")->attribute("v") == "a < b && c AB &unknown;");
    }

    TEST_CASE("numeric entities beyond the Unicode range are kept as written") {
        const svg_markup_parser parser{};
        CHECK(parser.parse(R"(<t v="&#99999999999;"/>)").find_first("t")->attribute("v") == "&#99999999999;");
        CHECK(parser.parse(R"(<t v="&#x110000;"/>)").find_first("t")->attribute("v") == "&#x110000;");
        CHECK(parser.parse(R"(<t v="&#x10FFFF;"/>)").find_first("t")->attribute("v") == "\xF4\x8F\xBF\xBF");
    }

    TEST_CASE("doctype, CDATA, comments and text are skipped") {
        const auto doc = svg_markup_parser{}.parse(
            "<!DOCTYPE svg [ <!ENTITY x 'y'> ]>\n"
            "<svg>text<![CDATA[<path d='M9 9'/>]]><!-- <rect/> --><path d='M0 0'/></svg>");
        std::vector<const markup_element*> paths;
        doc.collect("path", paths);
        REQUIRE(paths.size() == 1);
        CHECK(paths[0]->attribute("d") == "M0 0");
        CHECK(doc.find_first("rect") == nullptr);
    }

    TEST_CASE("malformed markup is rejected") {
        svg_markup_parser parser;
        CHECK_THROWS_AS((void)parser.parse("<svg><path></svg>"), markup_parse_error);
        CHECK_THROWS_AS((void)parser.parse("<svg>"), markup_parse_error);
        CHECK_THROWS_AS((void)parser.parse("<svg width=10/>"), markup_parse_error);
        CHECK_THROWS_AS((void)parser.parse("<svg width=\"10/>"), markup_parse_error);
        CHECK_THROWS_AS((void)parser.parse("<svg><!-- open"), markup_parse_error);
        CHECK_THROWS_AS((void)parser.parse("<!DOCTYPE svg"), markup_parse_error);
    }

    TEST_CASE("excessive nesting is rejected") {
        std::string deep;
        for (int i = 0; i < 600; ++i) deep += "<g>";
        for (int i = 0; i < 600; ++i) deep += "</g>";
        CHECK_THROWS_AS((void)svg_markup_parser{}.parse(deep), markup_parse_error);
    }

    TEST_CASE("default parser") {
        const auto parser = make_default_markup_parser();
        REQUIRE(parser != nullptr);
        CHECK(parser->parse("<svg/>").find_first("svg") != nullptr);
    }
}
