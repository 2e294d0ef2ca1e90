#ifndef REFLOW_TEXT_TEXT_MEASURER_H
#define REFLOW_TEXT_TEXT_MEASURER_H

#include <cstdint>
#include <string_view>

namespace reflow::text {

/**
 * TextMeasurer: Pluggable width measurement for tab alignment.
 *
 * Widths must be in the same linear unit as the run widths handed to the
 * tab layout functions.
 */
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    /**
     * Measure the advance width of text as it would be set in the given run.
     * @param runId Opaque run identifier (selects font and size)
     * @param text UTF-8 text
     * @return Advance width, 0 if the run cannot be measured
     */
    virtual float measureText(std::uint32_t runId, std::string_view text) const = 0;
};

} // namespace reflow::text

#endif // REFLOW_TEXT_TEXT_MEASURER_H
