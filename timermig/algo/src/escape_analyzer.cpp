#include <timermig/algo/escape_analyzer.hpp>

namespace timermig::algo {

EscapeVerdict analyze_handle_escape(const core::TimerFact& fact) {
    if (!fact.uses_timer_handle) {
        return EscapeVerdict::safe();
    }
    if (!fact.timer_handle_escapes && !fact.uses_timer_handle_param_in_timeout) {
        return EscapeVerdict::safe();
    }
    return EscapeVerdict::unsafe(kHandleEscapeReason);
}

EscapeVerdict analyze_schedule_escape(const core::TimerFact& fact) {
    if (!fact.uses_timer_get_schedule || !fact.timer_get_schedule_escapes) {
        return EscapeVerdict::safe();
    }
    return EscapeVerdict::unsafe(kScheduleEscapeReason);
}

} // namespace timermig::algo
