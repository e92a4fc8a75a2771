#include <timermig/algo/report_emitter.hpp>

#include <string>

namespace timermig::algo {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

core::JobSkeleton make_skeleton(std::string_view unit_name, const core::JobConfig& config) {
    core::JobSkeleton job;
    job.name = std::string(unit_name) + "Job";
    job.durable = config.persistent;
    job.trigger.identity = std::string(unit_name) + "Trigger";
    job.trigger.cron = config.cron;
    job.data = config.data;
    return job;
}

} // anonymous namespace

core::Report emit(std::string_view unit_name, const core::Verdict& verdict) {
    core::Report report;
    report.unit_name = std::string(unit_name);
    report.status = core::status_of(verdict);
    report.rule = core::rule_of(verdict);

    std::visit(
        overloaded{
            [&](const core::Automatic& automatic) {
                report.job = make_skeleton(unit_name, automatic.config);
            },
            [&](const core::PartialAutomatic& partial) {
                report.job = make_skeleton(unit_name, partial.config);
                report.reasons = partial.reasons;
            },
            [&](const core::ManualRequired& manual) {
                report.reasons = manual.reasons;
            },
        },
        verdict);

    return report;
}

} // namespace timermig::algo
