#include <catch2/catch_test_macros.hpp>
#include "explorer/content_type.hpp"

using namespace apidocs;

TEST_CASE("ContentType: well-known extensions", "[content_type]") {
    CHECK(content_type_for_extension(".html") == "text/html; charset=utf-8");
    CHECK(content_type_for_extension(".css") == "text/css; charset=utf-8");
    CHECK(content_type_for_extension(".js") == "application/javascript");
    CHECK(content_type_for_extension(".png") == "image/png");
    CHECK(content_type_for_extension(".json") == "application/json; charset=utf-8");
}

TEST_CASE("ContentType: unknown or absent extension sets nothing", "[content_type]") {
    CHECK_FALSE(content_type_for_extension("").has_value());
    CHECK_FALSE(content_type_for_extension(".svg").has_value());
    CHECK_FALSE(content_type_for_extension(".map").has_value());
    CHECK_FALSE(content_type_for_extension("html").has_value());
}

TEST_CASE("ContentType: extension match is case-sensitive", "[content_type]") {
    CHECK_FALSE(content_type_for_extension(".HTML").has_value());
    CHECK_FALSE(content_type_for_extension(".Js").has_value());
}

TEST_CASE("ContentType: path_extension takes the last dot", "[content_type]") {
    CHECK(path_extension("swagger-ui-bundle.js") == ".js");
    CHECK(path_extension("swagger-ui.css.map") == ".map");
    CHECK(path_extension("archive.tar.gz") == ".gz");
    CHECK(path_extension("README") == "");
    CHECK(path_extension("") == "");
    CHECK(path_extension(".hidden") == ".hidden");
}

TEST_CASE("ContentType: path_extension ignores dots in directories", "[content_type]") {
    CHECK(path_extension("v1.2/README") == "");
    CHECK(path_extension("v1.2/index.html") == ".html");
}

TEST_CASE("ContentType: content_type_for_path composes both", "[content_type]") {
    CHECK(content_type_for_path("index.html") == "text/html; charset=utf-8");
    CHECK(content_type_for_path("doc.json") == "application/json; charset=utf-8");
    CHECK(content_type_for_path("favicon-32x32.png") == "image/png");
    CHECK_FALSE(content_type_for_path("").has_value());
    CHECK_FALSE(content_type_for_path("oauth2-redirect").has_value());
}
