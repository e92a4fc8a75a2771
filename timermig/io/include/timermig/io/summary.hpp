#pragma once

/// @file summary.hpp
/// @brief Aggregate counts over the reports of a migration run.
/// @ingroup io_summary

#include <timermig/core/report.hpp>

#include <cstdint>
#include <map>
#include <vector>

namespace timermig::io {

/// @brief Number of units per migration status and per decision rule.
///
/// @ingroup io_summary
/// @see compute_summary
struct MigrationSummary {
    uint64_t total{0};
    uint64_t automatic{0};
    uint64_t partial_automatic{0};
    uint64_t manual_required{0};
    uint64_t with_advisories{0};  ///< Units whose facts raised at least one advisory.

    /// @brief Units per decision rule; rules that never matched are absent.
    std::map<core::DecisionRule, uint64_t> per_rule;

    /// @brief Account for one more report.
    void add(const core::Report& report);
};

/// @brief Summarise a complete set of reports.
[[nodiscard]] MigrationSummary compute_summary(const std::vector<core::Report>& reports);

} // namespace timermig::io
