#include <timermig/io/summary.hpp>

namespace timermig::io {

void MigrationSummary::add(const core::Report& report) {
    ++total;
    switch (report.status) {
        case core::MigrationStatus::Automatic:
            ++automatic;
            break;
        case core::MigrationStatus::PartialAutomatic:
            ++partial_automatic;
            break;
        case core::MigrationStatus::ManualRequired:
            ++manual_required;
            break;
    }
    if (!report.advisories.empty()) {
        ++with_advisories;
    }
    ++per_rule[report.rule];
}

MigrationSummary compute_summary(const std::vector<core::Report>& reports) {
    MigrationSummary summary;
    for (const auto& report : reports) {
        summary.add(report);
    }
    return summary;
}

} // namespace timermig::io
