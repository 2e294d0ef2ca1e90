#ifndef REFLOW_TEXT_SHAPING_TEXT_MEASURER_H
#define REFLOW_TEXT_SHAPING_TEXT_MEASURER_H

#include "reflow/text/font_manager.h"
#include "reflow/text/text_measurer.h"

#include <cstdint>
#include <string_view>
#include <unordered_map>

// Forward declarations
typedef struct hb_buffer_t hb_buffer_t;

namespace reflow::text {

struct RunStyle {
    std::uint32_t fontId;       // 0 = default font
    float fontSize;             // Layout units
};

/**
 * ShapingTextMeasurer: TextMeasurer backed by HarfBuzz shaping.
 *
 * Widths are the sum of shaped x advances with ligatures disabled, so a
 * prefix measures the same whether or not it is followed by more text.
 */
class ShapingTextMeasurer : public TextMeasurer {
public:
    explicit ShapingTextMeasurer(FontManager* fontManager);
    ~ShapingTextMeasurer() override;

    // Non-copyable
    ShapingTextMeasurer(const ShapingTextMeasurer&) = delete;
    ShapingTextMeasurer& operator=(const ShapingTextMeasurer&) = delete;

    /**
     * Associate a run with the font and size it is set in.
     */
    void setRunStyle(std::uint32_t runId, const RunStyle& style);
    void clearRunStyle(std::uint32_t runId);
    void clearAllRunStyles();

    float measureText(std::uint32_t runId, std::string_view text) const override;

    /**
     * Shape and measure text in an explicit font and size.
     * @return Advance width, 0 if the font is unavailable
     */
    float measureWithStyle(const RunStyle& style, std::string_view text) const;

private:
    FontManager* fontManager_ = nullptr;
    std::unordered_map<std::uint32_t, RunStyle> runStyles_;

    // HarfBuzz buffer (reused for shaping)
    mutable hb_buffer_t* hbBuffer_ = nullptr;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_SHAPING_TEXT_MEASURER_H
