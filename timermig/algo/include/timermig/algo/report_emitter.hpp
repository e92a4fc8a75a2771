#pragma once

/// @file report_emitter.hpp
/// @brief Rendering of verdicts into migration reports.
/// @ingroup algo_report

#include <timermig/core/report.hpp>
#include <timermig/core/verdict.hpp>

#include <string_view>

namespace timermig::algo {

/// @brief Build the report of one unit from its verdict.
/// @ingroup algo_report
///
/// Automatic and partial verdicts yield a job skeleton named
/// `<unit>Job` in group @ref core::kJobGroup with a trigger named
/// `<unit>Trigger`; the trigger carries the cron expression, or is left TBD
/// when the verdict has none. Manual verdicts carry no skeleton.
///
/// Reasons are copied verbatim in the order the classifier produced them.
///
/// @param unit_name  Identifier of the unit (typically a class name).
/// @param verdict    Classification of the unit.
/// @return A new report; @p verdict is left untouched.
[[nodiscard]] core::Report emit(std::string_view unit_name, const core::Verdict& verdict);

} // namespace timermig::algo
