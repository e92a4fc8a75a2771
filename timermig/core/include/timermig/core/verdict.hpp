#pragma once

#include <timermig/core/cron.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace timermig::core {

/// @brief Row of the decision table that produced a verdict.
/// @ingroup core_verdict
///
/// The numeric value is the row's position in the table (1-based), which is
/// also the evaluation order.
enum class DecisionRule {
    MixedPattern = 1,         ///< Mixed creation patterns.
    UnsafeEscape = 2,         ///< Handle or schedule object escapes.
    DynamicWithoutSchedule = 3,
    LiteralSchedule = 4,      ///< Schedule translated to cron.
    UntranslatableSchedule = 5,
    ProgrammaticTimer = 6,    ///< Job skeleton, trigger left to a human.
    Unclassified = 7          ///< Catch-all.
};

/// @brief Ordered key/value pairs destined for a Quartz JobDataMap.
using JobDataMap = std::vector<std::pair<std::string, std::string>>;

/// @brief Scheduler configuration derived for an automatically migrated unit.
/// @ingroup core_verdict
struct JobConfig {
    /// Trigger schedule. Absent for programmatic timers, whose trigger
    /// has to be configured by hand.
    std::optional<CronExpression> cron;
    bool persistent{true};
    JobDataMap data;

    bool operator==(const JobConfig&) const = default;
};

/// @brief Unit can be migrated without human intervention.
struct Automatic {
    DecisionRule rule{DecisionRule::LiteralSchedule};
    JobConfig config;

    bool operator==(const Automatic&) const = default;
};

/// @brief Unit must be migrated by hand.
struct ManualRequired {
    DecisionRule rule{DecisionRule::Unclassified};
    std::vector<std::string> reasons;  ///< In production order.

    bool operator==(const ManualRequired&) const = default;
};

/// @brief Job can be generated, the rest needs a human.
struct PartialAutomatic {
    DecisionRule rule{DecisionRule::ProgrammaticTimer};
    JobConfig config;
    std::vector<std::string> reasons;

    bool operator==(const PartialAutomatic&) const = default;
};

/// @brief Classification outcome for one unit; exactly one alternative holds.
/// @ingroup core_verdict
/// @see algo::classify
using Verdict = std::variant<Automatic, ManualRequired, PartialAutomatic>;

/// @brief Machine-readable migration status.
enum class MigrationStatus {
    Automatic,
    PartialAutomatic,
    ManualRequired
};

/// @brief Status of a verdict.
[[nodiscard]] MigrationStatus status_of(const Verdict& verdict) noexcept;

/// @brief Decision-table row recorded in a verdict.
[[nodiscard]] DecisionRule rule_of(const Verdict& verdict) noexcept;

/// @brief Status tag: "automatic", "partial_automatic" or "manual_required".
[[nodiscard]] std::string_view to_string(MigrationStatus status) noexcept;

/// @brief Short identifier of a decision rule, e.g. "mixed_pattern".
[[nodiscard]] std::string_view to_string(DecisionRule rule) noexcept;

/// @brief 1-based position of a rule in the decision table.
[[nodiscard]] constexpr int rule_index(DecisionRule rule) noexcept {
    return static_cast<int>(rule);
}

} // namespace timermig::core
