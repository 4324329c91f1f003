#include <catch2/catch_all.hpp>
#include "core/Errors.hpp"
#include "parser/LinkExtractor.hpp"
#include "parser/MetadataPageParser.hpp"
#include "parser/MetadataParser.hpp"

using namespace WebCrawl;

TEST_CASE("LinkExtractor collects anchors in document order") {
    const std::string html = R"(
        <html><body>
          <a href="/about">About
             us</a>
          <p>No link here</p>
          <a href="https://other.com/x">  <b>Other</b> site </a>
          <a name="anchor-without-href">skip</a>
          <a href="mailto:me@example.com">Mail</a>
        </body></html>)";

    auto links = LinkExtractor::Extract(html);
    REQUIRE(links.size() == 3);
    CHECK(links[0].url == "/about");
    CHECK(links[0].text == "About us");
    CHECK(links[1].url == "https://other.com/x");
    CHECK(links[1].text == "Other site");
    CHECK(links[2].url == "mailto:me@example.com");
}

TEST_CASE("LinkExtractor tolerates empty input") {
    CHECK(LinkExtractor::Extract("").empty());
    CHECK(LinkExtractor::Extract("<html><body>plain text</body></html>").empty());
}

TEST_CASE("MetadataParser reads title, open graph and canonical link") {
    const std::string html = R"(
        <html lang="en"><head>
          <title>  Example   Page </title>
          <meta property="og:description" content="An example">
          <meta property="og:image" content="https://example.com/a.png">
          <meta property="og:site_name" content="Example">
          <meta property="og:url" content="https://example.com/og">
          <link rel="canonical" href="https://example.com/canonical">
        </head><body></body></html>)";

    auto meta = MetadataParser::Parse(html);
    REQUIRE(meta.has_value());
    CHECK(meta->title == "Example Page");
    CHECK(meta->description == "An example");
    CHECK(meta->image_url == "https://example.com/a.png");
    CHECK(meta->site_name == "Example");
    CHECK(meta->canonical_url == "https://example.com/canonical");
    CHECK(meta->language == "en");
}

TEST_CASE("MetadataParser falls back to twitter and description tags") {
    const std::string html = R"(
        <html><head>
          <meta name="twitter:title" content="Tweet title">
          <meta name="description" content="Plain description">
          <meta name="twitter:image" content="https://example.com/t.png">
        </head></html>)";

    auto meta = MetadataParser::Parse(html);
    REQUIRE(meta.has_value());
    CHECK(meta->title == "Tweet title");
    CHECK(meta->description == "Plain description");
    CHECK(meta->image_url == "https://example.com/t.png");
}

TEST_CASE("MetadataPageParser reports pages without metadata") {
    MetadataPageParser parser;

    FetchResponse empty;
    empty.url = "https://example.com/empty";
    CHECK_THROWS_AS(parser.Parse(empty), ParseError);

    FetchResponse bare;
    bare.url = "https://example.com/bare";
    bare.html = "<html><head></head><body><p>hi</p></body></html>";
    CHECK_THROWS_AS(parser.Parse(bare), ParseError);

    FetchResponse page;
    page.url = "https://example.com";
    page.html = "<html><head><title>Hello</title></head></html>";
    auto parsed = parser.Parse(page);
    const auto* meta = std::any_cast<Metadata>(&parsed);
    REQUIRE(meta != nullptr);
    CHECK(meta->title == "Hello");
}
