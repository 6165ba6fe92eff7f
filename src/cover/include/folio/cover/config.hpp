#pragma once

#include "folio/core/types.hpp"
#include "folio/cover/encoder.hpp"
#include "folio/text/font.hpp"

namespace folio::cover {

// ============================================================================
// Cover Configuration
// ============================================================================

/**
 * @brief Engine-wide settings shared by every render
 */
struct CoverConfig {
    /**
     * @brief Largest accepted width or height, in pixels
     */
    i32 max_dimension = 16384;

    /**
     * @brief Maximum wrapped line width as a fraction of canvas width
     */
    f32 max_line_width_ratio = 0.8f;

    /**
     * @brief Column stride for diagonal and radial gradients (1 = per pixel)
     * Rows are always evaluated exactly; along a row the color is sampled at
     * the first column of each run and held across it.
     */
    i32 gradient_sample_stride = 4;

    /**
     * @brief Encoded output format for render_encoded
     */
    ImageFormat output_format = ImageFormat::Jpeg;

    /**
     * @brief JPEG quality, 1-100
     */
    i32 jpeg_quality = 95;

    /**
     * @brief Font files tried in order for text without wide characters
     */
    text::FontChain latin_fonts = text::FontContext::default_latin_chain();

    /**
     * @brief Font files tried in order for text containing CJK characters
     */
    text::FontChain cjk_fonts = text::FontContext::default_cjk_chain();

    /**
     * @brief Restrict the palette draw to palettes matching the title's genre
     */
    bool genre_palettes = false;
};

} // namespace folio::cover
