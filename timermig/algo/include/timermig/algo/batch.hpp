#pragma once

/// @file batch.hpp
/// @brief Classification of many units on a pool of worker threads.
/// @ingroup algo_batch

#include <timermig/core/facts.hpp>
#include <timermig/core/report.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace timermig::algo {

/// @brief Turns one unit into its report.
using UnitProcessor = std::function<core::Report(const core::MigrationUnit&)>;

/// @brief Classify one unit and render its report, advisories included.
/// @see classify, emit, check_pattern_consistency
[[nodiscard]] core::Report process_unit(const core::MigrationUnit& unit);

/// @brief Classify every unit, in parallel.
/// @ingroup algo_batch
///
/// Workers pull unit indices from a shared queue and write each report to
/// its own slot, so the result order matches @p units regardless of
/// scheduling. Units share no state.
///
/// A std::exception thrown while processing a unit does not stop the
/// batch: that unit gets a ManualRequired report (rule 7) whose single
/// reason is `"classification failed: " + what()`.
///
/// @param units        Units to classify.
/// @param num_threads  Worker count; 0 picks the hardware concurrency.
///                     Never more workers than units are started.
/// @param processor    Called once per unit from a worker thread.
/// @return One report per unit, in input order.
[[nodiscard]] std::vector<core::Report> classify_batch(const std::vector<core::MigrationUnit>& units,
                                                       std::size_t num_threads,
                                                       const UnitProcessor& processor);

/// @brief Classify every unit with process_unit().
[[nodiscard]] std::vector<core::Report> classify_batch(const std::vector<core::MigrationUnit>& units,
                                                       std::size_t num_threads = 0);

} // namespace timermig::algo
