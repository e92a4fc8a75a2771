#include <timermig/core/facts.hpp>

#include <algorithm>
#include <cctype>

namespace timermig::core {

std::string_view to_string(TimerPattern pattern) noexcept {
    switch (pattern) {
        case TimerPattern::Interval: return "interval";
        case TimerPattern::Single:   return "single";
        case TimerPattern::Calendar: return "calendar";
        case TimerPattern::Mixed:    return "mixed";
        case TimerPattern::Unknown:  return "unknown";
    }
    return "unknown";
}

std::optional<TimerPattern> parse_timer_pattern(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "unknown") {
        return TimerPattern::Unknown;
    }
    if (lowered == "interval") {
        return TimerPattern::Interval;
    }
    if (lowered == "single") {
        return TimerPattern::Single;
    }
    if (lowered == "calendar") {
        return TimerPattern::Calendar;
    }
    if (lowered == "mixed") {
        return TimerPattern::Mixed;
    }
    return std::nullopt;
}

} // namespace timermig::core
