#pragma once

/// @file classifier.hpp
/// @brief Decision table mapping timer facts to a migration verdict.
/// @ingroup algo_classifier

#include <timermig/core/facts.hpp>
#include <timermig/core/verdict.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace timermig::algo {

inline constexpr std::string_view kMixedPatternReason =
    "mixed timer creation patterns require manual job-trigger mapping";
inline constexpr std::string_view kDynamicWithoutScheduleReason =
    "dynamic timer creation without static schedule";
inline constexpr std::string_view kProgrammaticTriggerReason =
    "manual Trigger configuration needed for programmatic timers";
inline constexpr std::string_view kUnclassifiedReason = "unclassified timer usage pattern";

/// @brief Classify one unit.
/// @ingroup algo_classifier
///
/// Rules are evaluated in order and the first match wins:
///   1. Mixed timer pattern -> ManualRequired.
///   2. Handle or schedule escape unsafe -> ManualRequired, handle reason first.
///   3. Dynamic creation with no translatable schedule -> ManualRequired.
///   4. Schedule translates -> Automatic with cron, persistence and data map.
///   5. Schedule fails to translate -> ManualRequired with the translator message.
///   6. No schedule and at most one @Timeout method -> PartialAutomatic.
///   7. Anything else -> ManualRequired.
///
/// The result depends only on the arguments.
///
/// @param fact      Class-level timer facts.
/// @param schedule  The unit's @Schedule facts, if it has any.
/// @return The verdict, tagged with the matching rule.
/// @see translate, analyze_handle_escape, analyze_schedule_escape
[[nodiscard]] core::Verdict classify(const core::TimerFact& fact,
                                     const std::optional<core::ScheduleFact>& schedule);

/// @brief Data map carried by a generated job.
///
/// Holds `info` when the class reads Timer.getInfo() or the schedule has a
/// payload, and `migrationNotes` when notes are present.
[[nodiscard]] core::JobDataMap build_job_data(const core::TimerFact& fact,
                                              const std::optional<core::ScheduleFact>& schedule);

/// @brief Report disagreements between the pattern and the creation flags.
///
/// The pattern stays authoritative for classification; mismatches are only
/// surfaced so that a reviewer can check the extractor output.
///
/// @return One advisory per mismatch, empty when consistent.
[[nodiscard]] std::vector<std::string> check_pattern_consistency(const core::TimerFact& fact);

} // namespace timermig::algo
