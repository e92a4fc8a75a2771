#include <timermig/algo/batch.hpp>
#include <timermig/algo/classifier.hpp>
#include <timermig/algo/report_emitter.hpp>

#include <algorithm>
#include <exception>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace timermig::algo {

namespace {

core::Report guarded(const UnitProcessor& processor, const core::MigrationUnit& unit) {
    try {
        return processor(unit);
    } catch (const std::exception& e) {
        core::Report report;
        report.unit_name = unit.name;
        report.status = core::MigrationStatus::ManualRequired;
        report.rule = core::DecisionRule::Unclassified;
        report.reasons.push_back(std::string("classification failed: ") + e.what());
        return report;
    }
}

} // anonymous namespace

core::Report process_unit(const core::MigrationUnit& unit) {
    auto report = emit(unit.name, classify(unit.timer, unit.schedule));
    report.advisories = check_pattern_consistency(unit.timer);
    return report;
}

std::vector<core::Report> classify_batch(const std::vector<core::MigrationUnit>& units,
                                         std::size_t num_threads) {
    return classify_batch(units, num_threads, process_unit);
}

std::vector<core::Report> classify_batch(const std::vector<core::MigrationUnit>& units,
                                         std::size_t num_threads,
                                         const UnitProcessor& processor) {
    std::vector<core::Report> reports(units.size());
    if (units.empty()) {
        return reports;
    }

    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 1;
        }
    }
    num_threads = std::min(num_threads, units.size());

    // Queue of indices to process
    std::queue<std::size_t> work_queue;
    for (std::size_t idx = 0; idx < units.size(); ++idx) {
        work_queue.push(idx);
    }
    std::mutex queue_mutex;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (std::size_t thread_idx = 0; thread_idx < num_threads; ++thread_idx) {
        threads.emplace_back([&units, &reports, &work_queue, &queue_mutex, &processor]() {
            while (true) {
                std::size_t index;
                {
                    std::lock_guard<std::mutex> lock(queue_mutex);
                    if (work_queue.empty()) {
                        break;
                    }
                    index = work_queue.front();
                    work_queue.pop();
                }

                // Each slot is written by exactly one worker.
                reports[index] = guarded(processor, units[index]);
            }
        });
    }

    for (auto& thr : threads) {
        thr.join();
    }

    return reports;
}

} // namespace timermig::algo
