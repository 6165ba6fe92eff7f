/**
 * Output Encoder - JPEG/PNG serialization through stb_image_write
 */

#include "folio/cover/encoder.hpp"
#include "folio/core/logger.hpp"
#include "folio/core/string.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

#ifdef FOLIO_HAS_STB_IMAGE_WRITE
#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STB_IMAGE_WRITE_STATIC
#include <stb_image_write.h>
#endif

namespace folio::cover {

namespace {

constexpr u8 JPEG_MAGIC[] = {0xFF, 0xD8, 0xFF};
constexpr u8 PNG_MAGIC[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

template<usize N>
bool starts_with(std::span<const u8> bytes, const u8 (&magic)[N]) {
    return bytes.size() >= N && std::equal(magic, magic + N, bytes.begin());
}

#ifdef FOLIO_HAS_STB_IMAGE_WRITE
void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<u8>*>(context);
    auto* begin = static_cast<const u8*>(data);
    out->insert(out->end(), begin, begin + size);
}
#endif

} // anonymous namespace

std::optional<ImageFormat> parse_image_format(std::string_view name) {
    std::string lower = to_ascii_lowercase(name);
    if (lower == "jpg" || lower == "jpeg") return ImageFormat::Jpeg;
    if (lower == "png") return ImageFormat::Png;
    return std::nullopt;
}

std::string_view EncodedImage::media_type() const {
    return format == ImageFormat::Png ? "image/png" : "image/jpeg";
}

std::string EncodedImage::file_name() const {
    return "cover." + std::string(extension());
}

bool encoder_available() {
#ifdef FOLIO_HAS_STB_IMAGE_WRITE
    return true;
#else
    return false;
#endif
}

Result<EncodedImage, CoverError> encode(const raster::Canvas& canvas, ImageFormat format,
                                        i32 quality) {
#ifdef FOLIO_HAS_STB_IMAGE_WRITE
    EncodedImage image;
    image.format = format;
    image.bytes.reserve(static_cast<usize>(canvas.stride()) * canvas.height() / 4);

    int ok = 0;
    if (format == ImageFormat::Jpeg) {
        ok = stbi_write_jpg_to_func(append_bytes, &image.bytes, canvas.width(), canvas.height(),
                                    raster::Canvas::CHANNELS, canvas.pixels().data(),
                                    std::clamp(quality, 1, 100));
    } else {
        ok = stbi_write_png_to_func(append_bytes, &image.bytes, canvas.width(), canvas.height(),
                                    raster::Canvas::CHANNELS, canvas.pixels().data(),
                                    canvas.stride());
    }

    if (!ok || image.bytes.empty()) {
        FOLIO_LOG_ERROR("Failed to encode " + std::string(to_string(format)) + " image");
        return make_error(CoverError{CoverErrorKind::EncodeFailure,
                                     "image writer rejected the canvas"});
    }
    return image;
#else
    (void)canvas;
    (void)format;
    (void)quality;
    return make_error(CoverError{CoverErrorKind::Unavailable,
                                 "no image encoder was compiled in"});
#endif
}

std::optional<ImageFormat> detect_format(std::span<const u8> bytes) {
    if (starts_with(bytes, JPEG_MAGIC)) return ImageFormat::Jpeg;
    if (starts_with(bytes, PNG_MAGIC)) return ImageFormat::Png;
    return std::nullopt;
}

Result<EncodedImage, CoverError> load_cover_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(CoverError{CoverErrorKind::IoFailure, "cannot open " + path});
    }

    std::vector<u8> bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return make_error(CoverError{CoverErrorKind::IoFailure, "cannot read " + path});
    }

    auto format = detect_format(bytes);
    if (!format) {
        return make_error(CoverError{CoverErrorKind::UnsupportedFormat,
                                     path + " is neither JPEG nor PNG"});
    }
    return EncodedImage{std::move(bytes), *format};
}

Result<void, CoverError> save_image(const EncodedImage& image, const std::string& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return make_error(CoverError{CoverErrorKind::IoFailure, "cannot create " + path});
    }
    file.write(reinterpret_cast<const char*>(image.bytes.data()),
               static_cast<std::streamsize>(image.bytes.size()));
    if (!file) {
        return make_error(CoverError{CoverErrorKind::IoFailure, "cannot write " + path});
    }
    return {};
}

} // namespace folio::cover
