#pragma once

#include "folio/cover/config.hpp"
#include "folio/cover/cover_types.hpp"
#include "folio/cover/decoration.hpp"
#include "folio/cover/design_plan.hpp"
#include "folio/cover/encoder.hpp"
#include "folio/cover/typography.hpp"
#include "folio/core/random.hpp"
#include "folio/raster/canvas.hpp"
#include "folio/text/font.hpp"
#include <memory>
#include <string>
#include <vector>

namespace folio::cover {

/// Where each role's font came from
struct FontReport {
    std::string title_source;
    std::string author_source;
    std::string subtitle_source;
    bool used_builtin_font{false};
};

struct RenderResult {
    raster::Canvas canvas;
    DesignPlan plan;
    TextLayout layout;
    std::vector<Overlay> overlays;
    FontReport fonts;
};

struct Capabilities {
    bool rasterizer{false};
    bool encoder{false};
};

// ============================================================================
// Cover Engine
// ============================================================================

/// Runs design selection, background, decoration, typography and encoding
/// for one request at a time. Not thread-safe: the font context caches faces.
class CoverEngine {
public:
    explicit CoverEngine(CoverConfig config = {},
                         std::shared_ptr<text::FontContext> fonts = std::make_shared<text::FontContext>());

    [[nodiscard]] const Capabilities& capabilities() const noexcept { return m_capabilities; }

    /// Rasterizer and encoder both present
    [[nodiscard]] bool is_available() const noexcept {
        return m_capabilities.rasterizer && m_capabilities.encoder;
    }

    [[nodiscard]] const CoverConfig& config() const noexcept { return m_config; }

    [[nodiscard]] static Result<void, CoverError> validate(const CoverRequest& request,
                                                           const CoverConfig& config);

    [[nodiscard]] Result<RenderResult, CoverError> render(const CoverRequest& request,
                                                          Random& random);

    /// Seeds from request.seed, or from entropy when it is absent
    [[nodiscard]] Result<RenderResult, CoverError> render(const CoverRequest& request);

    [[nodiscard]] Result<EncodedImage, CoverError> render_encoded(const CoverRequest& request,
                                                                  Random& random);
    [[nodiscard]] Result<EncodedImage, CoverError> render_encoded(const CoverRequest& request);

    /// Bypasses generation and returns a user-supplied cover file
    [[nodiscard]] Result<EncodedImage, CoverError> load_premade_cover(const std::string& path) const;

private:
    [[nodiscard]] text::FontResolution resolve_font(std::string_view text, f32 size);
    [[nodiscard]] static Random seeded(const CoverRequest& request);

    CoverConfig m_config;
    std::shared_ptr<text::FontContext> m_fonts;
    Capabilities m_capabilities;
};

} // namespace folio::cover
