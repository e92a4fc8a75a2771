#include <timermig/io/summary.hpp>

#include <gtest/gtest.h>

using namespace timermig::io;
using namespace timermig::core;

namespace {

Report make_report(MigrationStatus status, DecisionRule rule, bool advisory = false) {
    Report report;
    report.status = status;
    report.rule = rule;
    if (advisory) {
        report.advisories.emplace_back("advisory");
    }
    return report;
}

} // anonymous namespace

TEST(SummaryTest, EmptyInput) {
    auto summary = compute_summary({});

    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(summary.automatic, 0u);
    EXPECT_TRUE(summary.per_rule.empty());
}

TEST(SummaryTest, CountsPerStatusAndRule) {
    std::vector<Report> reports{
        make_report(MigrationStatus::Automatic, DecisionRule::LiteralSchedule),
        make_report(MigrationStatus::Automatic, DecisionRule::LiteralSchedule, true),
        make_report(MigrationStatus::PartialAutomatic, DecisionRule::ProgrammaticTimer),
        make_report(MigrationStatus::ManualRequired, DecisionRule::MixedPattern, true),
        make_report(MigrationStatus::ManualRequired, DecisionRule::UnsafeEscape),
    };

    auto summary = compute_summary(reports);

    EXPECT_EQ(summary.total, 5u);
    EXPECT_EQ(summary.automatic, 2u);
    EXPECT_EQ(summary.partial_automatic, 1u);
    EXPECT_EQ(summary.manual_required, 2u);
    EXPECT_EQ(summary.with_advisories, 2u);
    EXPECT_EQ(summary.per_rule[DecisionRule::LiteralSchedule], 2u);
    EXPECT_EQ(summary.per_rule[DecisionRule::MixedPattern], 1u);
    EXPECT_EQ(summary.per_rule.count(DecisionRule::Unclassified), 0u);
}

TEST(SummaryTest, StatusCountsAddUpToTotal) {
    MigrationSummary summary;
    for (int idx = 0; idx < 10; ++idx) {
        summary.add(make_report(static_cast<MigrationStatus>(idx % 3), DecisionRule::Unclassified));
    }

    EXPECT_EQ(summary.total, 10u);
    EXPECT_EQ(summary.automatic + summary.partial_automatic + summary.manual_required,
              summary.total);
}
