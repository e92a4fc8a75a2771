#pragma once

#include <timermig/core/cron.hpp>
#include <timermig/core/verdict.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace timermig::core {

/// @brief Marker emitted in place of a trigger schedule that needs a human.
inline constexpr std::string_view kTriggerTbd = "TBD";

/// @brief Job group assigned to every generated job.
inline constexpr std::string_view kJobGroup = "migrated";

/// @brief Trigger part of a generated scheduler configuration.
/// @ingroup core_report
struct TriggerSkeleton {
    std::string identity;                ///< Trigger name, e.g. "ReportBeanTrigger".
    std::optional<CronExpression> cron;  ///< Empty when the trigger is TBD.

    /// @brief True when no schedule could be derived.
    [[nodiscard]] bool is_tbd() const noexcept { return !cron.has_value(); }

    bool operator==(const TriggerSkeleton&) const = default;
};

/// @brief Generated Quartz JobDetail/Trigger skeleton.
/// @ingroup core_report
struct JobSkeleton {
    std::string name;
    std::string group{kJobGroup};
    bool durable{true};  ///< Mirrors the persistence flag of the original timer.
    TriggerSkeleton trigger;
    JobDataMap data;

    bool operator==(const JobSkeleton&) const = default;
};

/// @brief Migration report of one unit.
/// @ingroup core_report
///
/// A Report is a self-contained value: it owns copies of everything it
/// shows and never refers back to the facts it was derived from.
///
/// @see algo::emit, ReportWriter
struct Report {
    std::string unit_name;
    MigrationStatus status{MigrationStatus::ManualRequired};
    DecisionRule rule{DecisionRule::Unclassified};
    std::optional<JobSkeleton> job;      ///< Present for automatic and partial verdicts.
    std::vector<std::string> reasons;    ///< Verbatim, in production order.
    std::vector<std::string> advisories; ///< Fact inconsistencies, never decisive.

    /// @brief Machine-readable status tag of this report.
    [[nodiscard]] std::string_view status_tag() const noexcept { return to_string(status); }

    bool operator==(const Report&) const = default;
};

} // namespace timermig::core
