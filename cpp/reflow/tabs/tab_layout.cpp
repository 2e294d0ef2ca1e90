#include "reflow/tabs/tab_layout.h"

#include "reflow/text/text_measurer.h"

#include <algorithm>
#include <cmath>
#include <string_view>

namespace reflow::tabs {

namespace {

enum class PendingAlignment : std::uint8_t { None, Decimal, Center, End };

PendingAlignment pendingFor(TabAlignment alignment) {
    switch (alignment) {
        case TabAlignment::Decimal: return PendingAlignment::Decimal;
        case TabAlignment::Center: return PendingAlignment::Center;
        case TabAlignment::End: return PendingAlignment::End;
        case TabAlignment::Start:
        case TabAlignment::Bar:
        case TabAlignment::Clear:
            return PendingAlignment::None;
    }
    return PendingAlignment::None;
}

TabWidthAlignment widthAlignmentFor(TabAlignment alignment) {
    switch (alignment) {
        case TabAlignment::Start: return TabWidthAlignment::Start;
        case TabAlignment::End: return TabWidthAlignment::End;
        case TabAlignment::Center: return TabWidthAlignment::Center;
        case TabAlignment::Decimal: return TabWidthAlignment::Decimal;
        case TabAlignment::Bar: return TabWidthAlignment::Bar;
        case TabAlignment::Clear: return TabWidthAlignment::Default;
    }
    return TabWidthAlignment::Default;
}

float clampToZero(float x) {
    return x < 0.0f ? 0.0f : x;
}

float decimalAlignedX(const TabbedRun& run, float stopPos, const LayoutWithTabsOptions& options) {
    const std::string& text = run.text;
    const std::size_t decimalIndex = text.find(options.decimalSeparator);
    if (decimalIndex == std::string::npos || decimalIndex == 0) {
        return stopPos;
    }

    float beforeWidth = 0.0f;
    if (options.measurer) {
        beforeWidth = options.measurer->measureText(run.runId, std::string_view(text).substr(0, decimalIndex));
    } else {
        beforeWidth = run.width * static_cast<float>(decimalIndex) / static_cast<float>(text.size());
    }
    return clampToZero(stopPos - beforeWidth);
}

float measure(const CalculateTabWidthParams& params, std::string_view text) {
    return params.measurer ? params.measurer->measureText(params.measureRunId, text) : 0.0f;
}

CalculateTabWidthResult defaultGridWidth(const CalculateTabWidthParams& params) {
    CalculateTabWidthResult result{};
    float width = params.defaultTabDistance;
    if (params.defaultLineLength > 0.0f && params.defaultTabDistance > 0.0f) {
        const float lineOffset = std::fmod(params.currentX, params.defaultLineLength);
        width = params.defaultTabDistance - std::fmod(lineOffset, params.defaultTabDistance);
    }
    if (width <= 0.0f) width = params.defaultTabDistance;
    result.width = width;
    result.alignment = TabWidthAlignment::Default;
    result.tabStopPosUsed = -1.0f;
    return result;
}

} // namespace

std::vector<RunPosition> layoutWithTabs(
    const std::vector<TabbedRun>& runs,
    const std::vector<LayoutStop>& stops,
    float lineWidth,
    const LayoutWithTabsOptions& options
) {
    (void)lineWidth; // Positions are not clipped to the line

    std::vector<RunPosition> result;
    result.reserve(runs.size());

    float currentX = 0.0f;
    std::size_t stopIndex = 0;
    PendingAlignment pending = PendingAlignment::None;
    float pendingStopPos = 0.0f;

    for (const TabbedRun& run : runs) {
        RunPosition out{};
        out.runId = run.runId;

        switch (run.kind) {
            case RunKind::Tab: {
                while (stopIndex < stops.size() && stops[stopIndex].position <= currentX) {
                    ++stopIndex;
                }

                if (stopIndex < stops.size()) {
                    const LayoutStop& stop = stops[stopIndex];
                    out.x = currentX;
                    out.width = 0.0f;
                    out.hasTabStop = true;
                    out.tabStop = stop;
                    result.push_back(out);

                    currentX = stop.position;
                    pending = pendingFor(stop.alignment);
                    pendingStopPos = currentX;
                    ++stopIndex;
                } else {
                    // Past the last stop the tab is plain whitespace
                    out.x = currentX;
                    out.width = run.width;
                    result.push_back(out);
                    currentX += run.width;
                    pending = PendingAlignment::None;
                }
                break;
            }
            case RunKind::Text:
            case RunKind::LineBreak: {
                switch (pending) {
                    case PendingAlignment::Decimal:
                        currentX = decimalAlignedX(run, pendingStopPos, options);
                        break;
                    case PendingAlignment::Center:
                        currentX = clampToZero(pendingStopPos - run.width / 2.0f);
                        break;
                    case PendingAlignment::End:
                        currentX = clampToZero(pendingStopPos - run.width);
                        break;
                    case PendingAlignment::None:
                        break;
                }
                pending = PendingAlignment::None;

                out.x = currentX;
                out.width = run.width;
                result.push_back(out);
                currentX += run.width;
                break;
            }
        }
    }

    return result;
}

CalculateTabWidthResult calculateTabWidth(const CalculateTabWidthParams& params) {
    const LayoutStop* nextStop = nullptr;
    for (const LayoutStop& stop : params.tabStops) {
        if (stop.alignment != TabAlignment::Clear && stop.position > params.currentX) {
            nextStop = &stop;
            break;
        }
    }

    if (!nextStop) {
        return defaultGridWidth(params);
    }

    const float stopPos = nextStop->position;
    float width = std::min(stopPos, params.paragraphWidth) - params.currentX;

    CalculateTabWidthResult result{};
    result.hasLeader = nextStop->leader != TabLeader::None;
    result.leader = nextStop->leader;
    result.alignment = widthAlignmentFor(nextStop->alignment);
    result.tabStopPosUsed = stopPos;

    switch (nextStop->alignment) {
        case TabAlignment::Bar:
            // Bar tabs draw a rule and take no space
            result.width = 0.0f;
            return result;
        case TabAlignment::Center:
            width -= measure(params, params.followingText) / 2.0f;
            break;
        case TabAlignment::End:
            width -= measure(params, params.followingText);
            break;
        case TabAlignment::Decimal: {
            const std::size_t decimalIndex = params.followingText.find(params.decimalSeparator);
            if (decimalIndex != std::string::npos) {
                width -= measure(params, std::string_view(params.followingText).substr(0, decimalIndex));
            }
            break;
        }
        case TabAlignment::Start:
        case TabAlignment::Clear:
            break;
    }

    if (width < 1.0f) {
        return defaultGridWidth(params);
    }

    result.width = width;
    return result;
}

} // namespace reflow::tabs
