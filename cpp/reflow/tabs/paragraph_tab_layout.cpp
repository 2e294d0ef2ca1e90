#include "reflow/tabs/paragraph_tab_layout.h"

#include "reflow/core/logging.h"
#include "reflow/tabs/tab_layout.h"
#include "reflow/text/text_measurer.h"

namespace reflow::tabs {

const TabLayoutEntry* ParagraphTabLayout::findTab(std::uint32_t tabIndex) const {
    for (const TabLayoutEntry& entry : tabs) {
        if (entry.tabIndex == tabIndex) return &entry;
    }
    return nullptr;
}

std::string collectFollowingText(const std::vector<ParagraphSpan>& spans, std::size_t startIndex) {
    std::string text;
    for (std::size_t i = startIndex; i < spans.size(); ++i) {
        const ParagraphSpan& span = spans[i];
        if (span.kind != RunKind::Text) break;
        text += span.text;
    }
    return text;
}

void prependHangingStop(std::vector<LayoutStop>& stops, float indentWidth, float hangingPx) {
    if (hangingPx <= 0.0f) return;
    LayoutStop stop{};
    stop.alignment = TabAlignment::Start;
    stop.position = indentWidth + hangingPx;
    stop.leader = TabLeader::None;
    stops.insert(stops.begin(), stop);
}

ParagraphTabLayout calculateParagraphTabLayout(
    const ParagraphTabRequest& request,
    const text::TextMeasurer* measurer
) {
    ParagraphTabLayout result{};
    result.paragraphId = request.paragraphId;
    result.revision = request.revision;

    // text-indent only applies to the first line; wrapped lines start without it
    const float effectiveTextIndent = request.indents.firstLine - request.indents.hanging;
    const float wrappedLineStartX = request.indentWidth - effectiveTextIndent;
    const float paragraphWidth = request.paragraphWidth;
    float currentX = request.indentWidth;

    CalculateTabWidthParams params{};
    params.tabStops = request.tabStops;
    params.paragraphWidth = paragraphWidth;
    params.defaultTabDistance = request.defaultTabDistance;
    params.defaultLineLength = request.defaultLineLength;
    params.measurer = measurer;

    std::uint32_t tabIndex = 0;
    for (std::size_t i = 0; i < request.spans.size(); ++i) {
        const ParagraphSpan& span = request.spans[i];
        switch (span.kind) {
            case RunKind::Text: {
                const float textWidth = measurer ? measurer->measureText(span.spanId, span.text) : 0.0f;
                if (currentX + textWidth > paragraphWidth + constants::SOFT_WRAP_THRESHOLD_PX) {
                    currentX = wrappedLineStartX;
                }
                currentX += textWidth;
                break;
            }
            case RunKind::LineBreak:
                currentX = wrappedLineStartX;
                break;
            case RunKind::Tab: {
                params.currentX = currentX;
                params.followingText = collectFollowingText(request.spans, i + 1);
                params.measureRunId = span.spanId;

                TabLayoutEntry entry{};
                entry.spanId = span.spanId;
                entry.tabIndex = tabIndex++;
                entry.metrics = calculateTabWidth(params);
                currentX += entry.metrics.width;
                result.tabs.push_back(entry);

                // A tab that reaches the right edge pushes what follows onto a new line
                if (currentX >= paragraphWidth - constants::SOFT_WRAP_THRESHOLD_PX) {
                    currentX = wrappedLineStartX;
                }
                break;
            }
        }
    }

    REFLOW_LOG_DEBUG("paragraph %u rev %u: %zu tabs resolved", result.paragraphId, result.revision, result.tabs.size());
    return result;
}

} // namespace reflow::tabs
