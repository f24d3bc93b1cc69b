#include <labelbridge/Translator.hpp>

#include <doctest/doctest.h>

#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

using namespace LB;
using LB::Layout::PlacedElement;

namespace {

// Serves in-memory bitmaps and records every request.
class FakeImageLoader final : public Raster::ImageLoader {
public:
    auto load(std::string const& uri, std::stop_token stop) -> Expected<Raster::RgbaBitmap> override {
        requests.push_back(uri);
        if (on_load) {
            on_load();
        }
        if (stop.stop_requested()) {
            return std::unexpected(Error{Error::Code::Cancelled, "stopped"});
        }
        auto it = images.find(uri);
        if (it == images.end()) {
            return std::unexpected(Error{Error::Code::NotFound, uri + " not found"});
        }
        return it->second;
    }

    std::map<std::string, Raster::RgbaBitmap> images;
    std::vector<std::string>                  requests;
    std::function<void()>                     on_load;
};

// 8x1, left half black.
auto half_black() -> Raster::RgbaBitmap {
    Raster::RgbaBitmap image;
    image.width = 8;
    image.height = 1;
    image.pixels.assign(8 * 4, 255);
    for (std::size_t x = 0; x < 4; ++x) {
        image.pixels[x * 4 + 0] = 0;
        image.pixels[x * 4 + 1] = 0;
        image.pixels[x * 4 + 2] = 0;
    }
    return image;
}

auto placed(std::string type, double left, double top, std::map<std::string, std::string> attributes = {}) -> PlacedElement {
    PlacedElement element;
    element.type = std::move(type);
    element.left = left;
    element.top = top;
    element.attributes = std::move(attributes);
    return element;
}

auto image(double left, double top, std::string src, std::string name = {}) -> PlacedElement {
    std::map<std::string, std::string> attributes{{"src", std::move(src)}};
    if (!name.empty()) {
        attributes.emplace("image-name", std::move(name));
    }
    return placed("zpl-image", left, top, std::move(attributes));
}

auto body(std::string const& script) -> std::string {
    return script.substr(7, script.size() - 9);
}

} // namespace

TEST_SUITE("translate.layout") {
    TEST_CASE("empty layout is header and footer") {
        FakeImageLoader loader;
        auto result = translateLayout({}, loader);
        REQUIRE(result.has_value());
        CHECK(result->script == "\x02L\rD11\rE\r");
        CHECK(result->diagnostics.empty());
    }

    TEST_CASE("elements translate in order") {
        FakeImageLoader loader;
        auto box = placed("zpl-graphic-box", 10, 20, {{"thickness", "2"}});
        box.width = 100;
        box.height = 50;
        auto circle = placed("zpl-graphic-circle", 30, 40);
        circle.width = 80;
        std::vector<PlacedElement> elements{
            placed("zpl-text", 100, 200, {{"text", "HELLO"}}),
            placed("zpl-barcode", 50, 60, {{"data", "12345"}}),
            placed("zpl-barcode", 5, 6, {{"data", "https://x"}, {"type", "qrcode"}}),
            box,
            circle,
        };

        auto result = translateLayout(elements, loader);
        REQUIRE(result.has_value());
        CHECK(body(result->script) == "1211000" "0200" "0100" "HELLO\r"
                                      "BC00600050" "12345\r"
                                      "B Q,M,S70006,0005,d2,https://x\r"
                                      "E0020,0010,0070,0110,2,2\r"
                                      "C0040,0030,80,1\r");
        CHECK(result->diagnostics.empty());
        CHECK(loader.requests.empty());
    }

    TEST_CASE("images are stored ahead of the layout and recalled in place") {
        FakeImageLoader loader;
        loader.images["logo.png"] = half_black();
        std::vector<PlacedElement> elements{
            placed("zpl-text", 1, 1, {{"text", "A"}}),
            image(12, 34, "logo.png", "LOGO"),
        };

        auto result = translateLayout(elements, loader);
        REQUIRE(result.has_value());
        CHECK(result->script == "\x02L\rD11\r"
                                "IDLOGO\rF0\r"
                                "1211000" "0001" "0001" "A\r"
                                "Y0034,0012,LOGO\r"
                                "E\r");
        CHECK(loader.requests == std::vector<std::string>{"logo.png"});
    }

    TEST_CASE("image threshold comes from the options") {
        FakeImageLoader loader;
        auto gray = half_black();
        for (std::size_t x = 4; x < 8; ++x) {
            gray.pixels[x * 4 + 0] = 100;
            gray.pixels[x * 4 + 1] = 100;
            gray.pixels[x * 4 + 2] = 100;
        }
        loader.images["gray.png"] = gray;

        TranslateOptions options;
        options.threshold = 101;
        auto result = translateLayout({image(0, 0, "gray.png")}, loader, options);
        REQUIRE(result.has_value());
        CHECK(body(result->script) == "IDIMG001\rFF\rY0000,0000,IMG001\r");
    }

    TEST_CASE("invalid threshold is rejected up front") {
        FakeImageLoader loader;
        TranslateOptions options;
        options.threshold = 300;
        auto result = translateLayout({placed("text", 0, 0)}, loader, options);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("a failed load drops only that image") {
        FakeImageLoader loader;
        loader.images["ok.png"] = half_black();
        std::vector<PlacedElement> elements{
            image(0, 0, "missing.png", "GONE"),
            image(5, 5, "ok.png", "OK"),
            placed("text", 1, 2, {{"text", "T"}}),
        };

        auto result = translateLayout(elements, loader);
        REQUIRE(result.has_value());
        CHECK(body(result->script) == "IDOK\rF0\r"
                                      "Y0005,0005,OK\r"
                                      "1211000" "0002" "0001" "T\r");
        REQUIRE(result->diagnostics.size() == 1);
        CHECK(result->diagnostics[0].kind == Diagnostic::Kind::ResourceFailure);
        CHECK(result->diagnostics[0].severity == Diagnostic::Severity::Error);
        CHECK(result->diagnostics[0].index == 0);
    }

    TEST_CASE("images are loaded one at a time in element order") {
        FakeImageLoader loader;
        loader.images["a.png"] = half_black();
        loader.images["b.png"] = half_black();
        std::vector<PlacedElement> elements{
            image(0, 0, "b.png", "B"),
            placed("text", 0, 0, {{"text", "x"}}),
            image(0, 0, "a.png", "A"),
        };
        auto result = translateLayout(elements, loader);
        REQUIRE(result.has_value());
        CHECK(loader.requests == std::vector<std::string>{"b.png", "a.png"});
        CHECK(body(result->script).starts_with("IDB\rF0\rIDA\rF0\r"));
    }

    TEST_CASE("the same image name and source is loaded once") {
        FakeImageLoader loader;
        loader.images["logo.png"] = half_black();
        std::vector<PlacedElement> elements{
            image(0, 0, "logo.png", "LOGO"),
            image(100, 0, "logo.png", "LOGO"),
            image(200, 0, "other.png", "LOGO"),
        };
        auto result = translateLayout(elements, loader);
        REQUIRE(result.has_value());
        CHECK(loader.requests.size() == 1);
        CHECK(body(result->script) == "IDLOGO\rF0\rY0000,0000,LOGO\rY0000,0100,LOGO\r");
        REQUIRE(result->diagnostics.size() == 1);
        CHECK(result->diagnostics[0].kind == Diagnostic::Kind::UnresolvedReference);
        CHECK(result->diagnostics[0].index == 2);
    }

    TEST_CASE("cancellation is a warning and skips remaining loads") {
        FakeImageLoader loader;
        loader.images["a.png"] = half_black();
        loader.images["b.png"] = half_black();
        std::stop_source source;
        loader.on_load = [&] { source.request_stop(); };

        TranslateOptions options;
        options.stop_token = source.get_token();
        std::vector<PlacedElement> elements{
            image(0, 0, "a.png", "A"),
            image(0, 0, "b.png", "B"),
            placed("text", 3, 4, {{"text", "T"}}),
        };

        auto result = translateLayout(elements, loader, options);
        REQUIRE(result.has_value());
        CHECK(loader.requests == std::vector<std::string>{"a.png"});
        CHECK(body(result->script) == "1211000" "0004" "0003" "T\r");
        REQUIRE(result->diagnostics.size() == 2);
        CHECK(result->diagnostics[0].kind == Diagnostic::Kind::Cancelled);
        CHECK(result->diagnostics[0].index == 0);
        CHECK(result->diagnostics[1].kind == Diagnostic::Kind::Cancelled);
        CHECK(result->diagnostics[1].index == 1);
        for (auto const& diagnostic : result->diagnostics) {
            CHECK(diagnostic.severity == Diagnostic::Severity::Warning);
        }
        CHECK_FALSE(hasErrors(result->diagnostics));
    }

    TEST_CASE("unsupported and malformed elements are skipped") {
        FakeImageLoader loader;
        auto no_size = placed("zpl-graphic-box", 0, 0);
        std::vector<PlacedElement> elements{
            placed("zpl-graphic-ellipse", 0, 0),
            no_size,
            placed("text", 10000, 0, {{"text", "FAR"}}),
            image(-5, 0, "logo.png"),
            placed("text", 0, 0, {{"text", "OK"}}),
        };
        auto result = translateLayout(elements, loader);
        REQUIRE(result.has_value());
        CHECK(body(result->script) == "121100000000000OK\r");
        REQUIRE(result->diagnostics.size() == 4);
        CHECK(result->diagnostics[0].kind == Diagnostic::Kind::UnsupportedElement);
        CHECK(result->diagnostics[1].kind == Diagnostic::Kind::MalformedCommand);
        CHECK(result->diagnostics[2].kind == Diagnostic::Kind::PositionOutOfRange);
        CHECK(result->diagnostics[3].kind == Diagnostic::Kind::PositionOutOfRange);
        CHECK(result->diagnostics[3].index == 3);
        CHECK(loader.requests.empty());
    }
}
