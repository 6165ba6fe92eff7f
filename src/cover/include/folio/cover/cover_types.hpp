#pragma once

#include "folio/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace folio::cover {

// ============================================================================
// Render request
// ============================================================================

struct CoverRequest {
    std::string title;
    std::optional<std::string> author;
    i32 width{1600};
    i32 height{2400};
    std::optional<std::string> subtitle;

    /// Seed for the convenience overloads that build their own Random
    std::optional<u32> seed;
};

// ============================================================================
// Errors
// ============================================================================

enum class CoverErrorKind : u8 {
    InvalidDimensions,
    Unavailable,
    IoFailure,
    UnsupportedFormat,
    EncodeFailure
};

[[nodiscard]] constexpr std::string_view to_string(CoverErrorKind kind) {
    switch (kind) {
        case CoverErrorKind::InvalidDimensions: return "invalid dimensions";
        case CoverErrorKind::Unavailable:       return "cover unavailable";
        case CoverErrorKind::IoFailure:         return "I/O failure";
        case CoverErrorKind::UnsupportedFormat: return "unsupported format";
        case CoverErrorKind::EncodeFailure:     return "encode failure";
    }
    return "unknown";
}

struct CoverError {
    CoverErrorKind kind;
    std::string message;
};

} // namespace folio::cover
