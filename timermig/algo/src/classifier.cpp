#include <timermig/algo/classifier.hpp>
#include <timermig/algo/cron_translator.hpp>
#include <timermig/algo/escape_analyzer.hpp>

#include <array>
#include <utility>
#include <variant>

namespace timermig::algo {

namespace {

using core::TimerPattern;

struct CreationStyle {
    TimerPattern pattern;
    bool recorded;
    std::string_view label;
};

} // anonymous namespace

core::JobDataMap build_job_data(const core::TimerFact& fact,
                                const std::optional<core::ScheduleFact>& schedule) {
    core::JobDataMap data;
    const std::string info = schedule ? schedule->info : std::string{};
    if (fact.uses_timer_info || !info.empty()) {
        data.emplace_back("info", info);
    }
    if (!fact.migration_notes.empty()) {
        data.emplace_back("migrationNotes", fact.migration_notes);
    }
    return data;
}

core::Verdict classify(const core::TimerFact& fact,
                       const std::optional<core::ScheduleFact>& schedule) {
    using core::DecisionRule;

    // Rule 1
    if (fact.timer_pattern == TimerPattern::Mixed) {
        return core::ManualRequired{DecisionRule::MixedPattern,
                                    {std::string(kMixedPatternReason)}};
    }

    // Rule 2: both checks run so that every reason is reported.
    const auto handle = analyze_handle_escape(fact);
    const auto schedule_object = analyze_schedule_escape(fact);
    if (!handle.is_safe() || !schedule_object.is_safe()) {
        core::ManualRequired verdict{DecisionRule::UnsafeEscape, {}};
        if (!handle.is_safe()) {
            verdict.reasons.push_back(handle.reason());
        }
        if (!schedule_object.is_safe()) {
            verdict.reasons.push_back(schedule_object.reason());
        }
        return verdict;
    }

    std::optional<TranslationResult> translated;
    if (schedule) {
        translated = translate(*schedule);
    }
    const core::CronExpression* cron =
        translated ? std::get_if<core::CronExpression>(&*translated) : nullptr;

    // Rule 3
    if (fact.dynamic_timer_creation && cron == nullptr) {
        return core::ManualRequired{DecisionRule::DynamicWithoutSchedule,
                                    {std::string(kDynamicWithoutScheduleReason)}};
    }

    // Rule 4
    if (cron != nullptr) {
        return core::Automatic{DecisionRule::LiteralSchedule,
                               core::JobConfig{*cron, schedule->persistent,
                                               build_job_data(fact, schedule)}};
    }

    // Rule 5
    if (translated) {
        const auto& error = std::get<TranslationError>(*translated);
        return core::ManualRequired{DecisionRule::UntranslatableSchedule, {error.message()}};
    }

    // Rule 6: programmatic timers keep the EJB default persistence.
    if (fact.timeout_method_count <= 1) {
        return core::PartialAutomatic{DecisionRule::ProgrammaticTimer,
                                      core::JobConfig{std::nullopt, true,
                                                      build_job_data(fact, std::nullopt)},
                                      {std::string(kProgrammaticTriggerReason)}};
    }

    // Rule 7
    return core::ManualRequired{DecisionRule::Unclassified, {std::string(kUnclassifiedReason)}};
}

std::vector<std::string> check_pattern_consistency(const core::TimerFact& fact) {
    const std::array<CreationStyle, 3> styles{{
        {TimerPattern::Single, fact.has_single_timer, "single-action"},
        {TimerPattern::Interval, fact.has_interval_timer, "interval"},
        {TimerPattern::Calendar, fact.has_calendar_timer, "calendar"},
    }};
    const std::string pattern(core::to_string(fact.timer_pattern));

    std::size_t recorded = 0;
    for (const auto& style : styles) {
        if (style.recorded) {
            ++recorded;
        }
    }

    std::vector<std::string> advisories;
    switch (fact.timer_pattern) {
        case TimerPattern::Single:
        case TimerPattern::Interval:
        case TimerPattern::Calendar:
            for (const auto& style : styles) {
                if (style.pattern == fact.timer_pattern && !style.recorded) {
                    advisories.push_back("timerPattern '" + pattern + "' but no " +
                                         std::string(style.label) + " timer creation recorded");
                } else if (style.pattern != fact.timer_pattern && style.recorded) {
                    advisories.push_back("timerPattern '" + pattern + "' but " +
                                         std::string(style.label) + " timer creation recorded");
                }
            }
            break;
        case TimerPattern::Mixed:
            if (recorded < 2) {
                advisories.push_back("timerPattern 'mixed' but " + std::to_string(recorded) +
                                     " timer creation style(s) recorded");
            }
            break;
        case TimerPattern::Unknown:
            if (recorded > 0) {
                advisories.push_back("timerPattern 'unknown' but " + std::to_string(recorded) +
                                     " timer creation style(s) recorded");
            }
            break;
    }

    if (recorded > 0 && fact.timeout_method_count == 0) {
        advisories.emplace_back("timers are created but no @Timeout method was recorded");
    }
    return advisories;
}

} // namespace timermig::algo
