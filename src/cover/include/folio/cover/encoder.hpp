#pragma once

#include "folio/cover/cover_types.hpp"
#include "folio/raster/canvas.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace folio::cover {

enum class ImageFormat : u8 {
    Jpeg,
    Png
};

[[nodiscard]] constexpr std::string_view to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Png:  return "png";
    }
    return "jpg";
}

[[nodiscard]] std::optional<ImageFormat> parse_image_format(std::string_view name);

struct EncodedImage {
    std::vector<u8> bytes;
    ImageFormat format{ImageFormat::Jpeg};

    [[nodiscard]] std::string_view media_type() const;
    [[nodiscard]] std::string_view extension() const { return to_string(format); }
    [[nodiscard]] std::string file_name() const;
};

// ============================================================================
// Output Encoder
// ============================================================================

/// Whether an image writer was compiled in
[[nodiscard]] bool encoder_available();

/// Serializes the canvas. `quality` applies to JPEG only and is clamped to 1-100.
[[nodiscard]] Result<EncodedImage, CoverError> encode(const raster::Canvas& canvas,
                                                      ImageFormat format, i32 quality = 95);

/// Identifies JPEG or PNG data from its leading bytes
[[nodiscard]] std::optional<ImageFormat> detect_format(std::span<const u8> bytes);

/// Reads a pre-made cover image as-is
[[nodiscard]] Result<EncodedImage, CoverError> load_cover_file(const std::string& path);

[[nodiscard]] Result<void, CoverError> save_image(const EncodedImage& image,
                                                  const std::string& path);

} // namespace folio::cover
