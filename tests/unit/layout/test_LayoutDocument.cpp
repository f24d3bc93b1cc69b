#include <labelbridge/layout/LayoutDocument.hpp>

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

using namespace LB;
using namespace LB::Layout;

TEST_SUITE("layout.document") {
    TEST_CASE("elements object with mixed pixel notations") {
        auto elements = parseLayoutDocument(R"({
            "elements": [
                {"type": "zpl-text", "left": "100px", "top": 200, "attributes": {"text": "HELLO"}},
                {"type": "zpl-graphic-box", "left": 10, "top": 20, "width": "100px", "height": 50.5,
                 "attributes": {"thickness": 2}}
            ]
        })");
        REQUIRE(elements.has_value());
        REQUIRE(elements->size() == 2);

        auto const& text = (*elements)[0];
        CHECK(text.type == "zpl-text");
        CHECK(text.left == 100.0);
        CHECK(text.top == 200.0);
        CHECK_FALSE(text.width.has_value());
        CHECK(text.attributes.at("text") == "HELLO");

        auto const& box = (*elements)[1];
        CHECK(box.width == 100.0);
        CHECK(box.height == 50.5);
        CHECK(box.attributes.at("thickness") == "2");
    }

    TEST_CASE("bare array is accepted") {
        auto elements = parseLayoutDocument(R"([{"type": "circle", "left": 1, "top": 2, "width": 30}])");
        REQUIRE(elements.has_value());
        REQUIRE(elements->size() == 1);
        CHECK((*elements)[0].width == 30.0);
    }

    TEST_CASE("scalar attributes are stringified") {
        auto elements = parseLayoutDocument(
            R"([{"type": "barcode", "left": 0, "top": 0, "attributes": {"data": 12345, "wide": true}}])");
        REQUIRE(elements.has_value());
        CHECK((*elements)[0].attributes.at("data") == "12345");
        CHECK((*elements)[0].attributes.at("wide") == "true");
    }

    TEST_CASE("unknown element types are left for the translator") {
        auto elements = parseLayoutDocument(R"([{"type": "zpl-graphic-ellipse", "left": 0, "top": 0}])");
        REQUIRE(elements.has_value());
        CHECK((*elements)[0].type == "zpl-graphic-ellipse");
    }

    TEST_CASE("malformed documents") {
        auto check_malformed = [](std::string_view text) {
            auto result = parseLayoutDocument(text);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::MalformedInput);
        };
        check_malformed("{not json");
        check_malformed(R"({"items": []})");
        check_malformed(R"({"elements": {}})");
        check_malformed(R"([42])");
        check_malformed(R"([{"left": 0, "top": 0}])");
        check_malformed(R"([{"type": "text", "left": 0}])");
        check_malformed(R"([{"type": "text", "left": "wide", "top": 0}])");
        check_malformed(R"([{"type": "text", "left": 0, "top": 0, "attributes": []}])");
        check_malformed(R"([{"type": "text", "left": 0, "top": 0, "attributes": {"text": {"nested": 1}}}])");
    }

    TEST_CASE("loadLayoutDocument reads from disk") {
        auto path = std::filesystem::temp_directory_path() / "labelbridge_layout_document_test.json";
        {
            std::ofstream out(path);
            out << R"({"elements": [{"type": "text", "left": 5, "top": 6, "attributes": {"text": "A"}}]})";
        }
        auto elements = loadLayoutDocument(path);
        std::filesystem::remove(path);
        REQUIRE(elements.has_value());
        CHECK(elements->size() == 1);

        auto missing = loadLayoutDocument(path);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::IoFailure);
    }
}
