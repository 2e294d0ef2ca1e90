#include "reflow/text/shaping_text_measurer.h"

#include "reflow/core/logging.h"

#include <hb.h>
#include <hb-ft.h>

namespace reflow::text {

ShapingTextMeasurer::ShapingTextMeasurer(FontManager* fontManager)
    : fontManager_(fontManager) {
    hbBuffer_ = hb_buffer_create();
}

ShapingTextMeasurer::~ShapingTextMeasurer() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

void ShapingTextMeasurer::setRunStyle(std::uint32_t runId, const RunStyle& style) {
    runStyles_[runId] = style;
}

void ShapingTextMeasurer::clearRunStyle(std::uint32_t runId) {
    runStyles_.erase(runId);
}

void ShapingTextMeasurer::clearAllRunStyles() {
    runStyles_.clear();
}

float ShapingTextMeasurer::measureText(std::uint32_t runId, std::string_view text) const {
    auto it = runStyles_.find(runId);
    if (it == runStyles_.end()) {
        REFLOW_LOG_DEBUG("measureText: no style for run %u", runId);
        return 0.0f;
    }
    return measureWithStyle(it->second, text);
}

float ShapingTextMeasurer::measureWithStyle(const RunStyle& style, std::string_view text) const {
    if (text.empty() || !fontManager_ || !hbBuffer_) {
        return 0.0f;
    }

    const FontHandle* fontHandle = fontManager_->getFont(style.fontId);
    if (!fontHandle || !fontHandle->hbFont) {
        REFLOW_LOG_DEBUG("measureText: font %u not loaded", style.fontId);
        return 0.0f;
    }
    if (!fontManager_->setFontSize(fontHandle->id, style.fontSize)) {
        return 0.0f;
    }

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);

    // Ligatures off: a prefix must measure the same as inside the full run
    hb_feature_t features[2];
    hb_feature_from_string("-liga", -1, &features[0]);
    hb_feature_from_string("-clig", -1, &features[1]);

    hb_shape(fontHandle->hbFont, hbBuffer_, features, 2);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!glyphPos) {
        return 0.0f;
    }

    // 26.6 fixed point to float
    const float scale = 1.0f / 64.0f;
    float width = 0.0f;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        width += static_cast<float>(glyphPos[i].x_advance) * scale;
    }
    return width;
}

} // namespace reflow::text
