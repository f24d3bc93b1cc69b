#pragma once

#include <labelbridge/core/Diagnostic.hpp>
#include <labelbridge/core/Error.hpp>
#include <labelbridge/layout/PlacedElement.hpp>
#include <labelbridge/raster/ImageLoader.hpp>
#include <labelbridge/raster/MonochromeEncoder.hpp>

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace LB {

struct TranslateOptions {
    int             threshold = Raster::kDefaultThreshold;
    bool            fail_on_decode_error = false; // a bad ~DG payload aborts the translation
    std::stop_token stop_token;
};

struct TranslationResult {
    std::string script;
    Diagnostics diagnostics;
};

// ZPL text to DPL. ~DG graphics become image storage commands, the first
// ^XA..^XZ block becomes the layout. Only an invalid threshold, or a decode error
// with fail_on_decode_error set, makes this return an error.
[[nodiscard]] auto translateZpl(std::string_view zpl, TranslateOptions const& options = {}) -> Expected<TranslationResult>;

// Placed elements to DPL. Images are acquired one at a time through the loader,
// in element order; a failed or cancelled load drops only that element.
[[nodiscard]] auto translateLayout(std::vector<Layout::PlacedElement> const& elements,
                                   Raster::ImageLoader& loader,
                                   TranslateOptions const& options = {}) -> Expected<TranslationResult>;

} // namespace LB
