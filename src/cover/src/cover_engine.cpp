/**
 * Cover Engine implementation
 */

#include "folio/cover/cover_engine.hpp"
#include "folio/cover/design_selector.hpp"
#include "folio/cover/gradient.hpp"
#include "folio/core/logger.hpp"
#include "folio/core/string.hpp"

namespace folio::cover {

CoverEngine::CoverEngine(CoverConfig config, std::shared_ptr<text::FontContext> fonts)
    : m_config(std::move(config))
    , m_fonts(fonts ? std::move(fonts) : std::make_shared<text::FontContext>())
{
    m_capabilities.rasterizer = m_fonts->is_available();
    m_capabilities.encoder = encoder_available();

    if (m_capabilities.rasterizer) {
        FOLIO_LOG_INFO("Font rasterizer available");
    } else {
        FOLIO_LOG_WARN("Font rasterizer unavailable, covers cannot be rendered");
    }
    if (m_capabilities.encoder) {
        FOLIO_LOG_INFO("Image encoder available");
    } else {
        FOLIO_LOG_WARN("Image encoder unavailable, covers cannot be encoded");
    }
}

Result<void, CoverError> CoverEngine::validate(const CoverRequest& request,
                                               const CoverConfig& config) {
    if (request.width <= 0 || request.height <= 0 ||
        request.width > config.max_dimension || request.height > config.max_dimension) {
        return make_error(CoverError{
            CoverErrorKind::InvalidDimensions,
            "cover size " + std::to_string(request.width) + "x" +
                std::to_string(request.height) + " is outside 1.." +
                std::to_string(config.max_dimension)
        });
    }
    return {};
}

Random CoverEngine::seeded(const CoverRequest& request) {
    if (request.seed) {
        return Random(*request.seed);
    }
    return Random::from_entropy();
}

text::FontResolution CoverEngine::resolve_font(std::string_view text, f32 size) {
    const bool wide = unicode::contains_wide(text);
    const auto& primary = wide ? m_config.cjk_fonts : m_config.latin_fonts;
    const auto& secondary = wide ? m_config.latin_fonts : m_config.cjk_fonts;

    text::FontChain chain;
    chain.reserve(primary.size() + secondary.size());
    chain.insert(chain.end(), primary.begin(), primary.end());
    chain.insert(chain.end(), secondary.begin(), secondary.end());
    return m_fonts->resolve(chain, size);
}

Result<RenderResult, CoverError> CoverEngine::render(const CoverRequest& request,
                                                     Random& random) {
    if (auto valid = validate(request, m_config); valid.is_err()) {
        FOLIO_LOG_WARN("Rejected cover request: " + valid.error().message);
        return make_error(valid.error());
    }
    if (!m_capabilities.rasterizer) {
        return make_error(CoverError{CoverErrorKind::Unavailable,
                                     "font rasterizer is not available"});
    }

    const SizeI size(request.width, request.height);

    // 1. Design decisions
    DesignPlan plan = DesignSelector(m_config.genre_palettes).select(random, size, request.title);
    FOLIO_LOG_DEBUG("Cover plan: " + plan.describe());

    auto canvas = raster::Canvas::create(size.width, size.height);
    if (!canvas) {
        return make_error(CoverError{CoverErrorKind::InvalidDimensions,
                                     "cannot allocate cover canvas"});
    }

    // 2. Background
    GradientRenderer(m_config.gradient_sample_stride)
        .render(*canvas, plan.palette, plan.background, random);

    // 3. Decorations
    auto overlays = DecorationCompositor().compose(*canvas, plan, random);

    // 4. Typography
    auto title_font = resolve_font(request.title, plan.title_font_size);
    auto author_font = resolve_font(request.author.value_or(""), plan.author_font_size);
    auto subtitle_font = resolve_font(request.subtitle.value_or(""), plan.author_font_size);

    FontReport report;
    report.title_source = title_font.source;
    report.author_source = author_font.source;
    report.subtitle_source = subtitle_font.source;
    report.used_builtin_font = title_font.used_builtin || author_font.used_builtin ||
                               subtitle_font.used_builtin;
    if (report.used_builtin_font) {
        FOLIO_LOG_WARN("No font file resolved for some cover text, using the built-in font");
    }

    RoleFonts fonts{title_font.font, author_font.font, subtitle_font.font};
    TypographyEngine typography(m_config.max_line_width_ratio);
    TextLayout layout = typography.layout(request, plan, fonts, size, random);
    typography.draw(*canvas, layout, fonts);

    return RenderResult{std::move(*canvas), std::move(plan), std::move(layout),
                        std::move(overlays), std::move(report)};
}

Result<RenderResult, CoverError> CoverEngine::render(const CoverRequest& request) {
    Random random = seeded(request);
    return render(request, random);
}

Result<EncodedImage, CoverError> CoverEngine::render_encoded(const CoverRequest& request,
                                                             Random& random) {
    if (!m_capabilities.encoder) {
        if (auto valid = validate(request, m_config); valid.is_err()) {
            return make_error(valid.error());
        }
        return make_error(CoverError{CoverErrorKind::Unavailable,
                                     "image encoder is not available"});
    }

    auto rendered = render(request, random);
    if (rendered.is_err()) {
        return make_error(std::move(rendered).error());
    }

    return encode(rendered.value().canvas, m_config.output_format, m_config.jpeg_quality);
}

Result<EncodedImage, CoverError> CoverEngine::render_encoded(const CoverRequest& request) {
    Random random = seeded(request);
    return render_encoded(request, random);
}

Result<EncodedImage, CoverError> CoverEngine::load_premade_cover(const std::string& path) const {
    auto image = load_cover_file(path);
    if (image.is_err()) {
        FOLIO_LOG_WARN("Pre-made cover not usable: " + image.error().message);
    } else {
        FOLIO_LOG_INFO("Using pre-made cover " + path);
    }
    return image;
}

} // namespace folio::cover
