#include <timermig/algo/report_emitter.hpp>

#include <timermig/core/cron.hpp>

#include <gtest/gtest.h>

using namespace timermig::algo;
using namespace timermig::core;

class ReportEmitterTest : public ::testing::Test {
protected:
    CronExpression nightly() { return parse_cron("0 0 2 * * ? *"); }
};

TEST_F(ReportEmitterTest, AutomaticVerdictHasScheduledJob) {
    Automatic automatic{DecisionRule::LiteralSchedule,
                        JobConfig{nightly(), true, {{"info", "nightly"}}}};

    auto report = emit("ReportBean", automatic);

    EXPECT_EQ(report.unit_name, "ReportBean");
    EXPECT_EQ(report.status, MigrationStatus::Automatic);
    EXPECT_EQ(report.rule, DecisionRule::LiteralSchedule);
    ASSERT_TRUE(report.job.has_value());
    EXPECT_EQ(report.job->name, "ReportBeanJob");
    EXPECT_EQ(report.job->group, kJobGroup);
    EXPECT_TRUE(report.job->durable);
    EXPECT_EQ(report.job->trigger.identity, "ReportBeanTrigger");
    EXPECT_FALSE(report.job->trigger.is_tbd());
    EXPECT_EQ(report.job->trigger.cron->to_string(), "0 0 2 * * ? *");
    ASSERT_EQ(report.job->data.size(), 1u);
    EXPECT_EQ(report.job->data[0].first, "info");
    EXPECT_TRUE(report.reasons.empty());
}

TEST_F(ReportEmitterTest, NonPersistentJobIsNotDurable) {
    Automatic automatic{DecisionRule::LiteralSchedule, JobConfig{nightly(), false, {}}};

    auto report = emit("Volatile", automatic);

    ASSERT_TRUE(report.job.has_value());
    EXPECT_FALSE(report.job->durable);
}

TEST_F(ReportEmitterTest, PartialVerdictHasTbdTrigger) {
    PartialAutomatic partial{DecisionRule::ProgrammaticTimer, JobConfig{},
                             {"manual Trigger configuration needed for programmatic timers"}};

    auto report = emit("PollerBean", partial);

    EXPECT_EQ(report.status, MigrationStatus::PartialAutomatic);
    EXPECT_EQ(report.rule, DecisionRule::ProgrammaticTimer);
    ASSERT_TRUE(report.job.has_value());
    EXPECT_EQ(report.job->name, "PollerBeanJob");
    EXPECT_TRUE(report.job->trigger.is_tbd());
    EXPECT_EQ(report.reasons, partial.reasons);
}

TEST_F(ReportEmitterTest, ManualVerdictHasNoJob) {
    ManualRequired manual{DecisionRule::UnsafeEscape, {"first", "second"}};

    auto report = emit("EscapeBean", manual);

    EXPECT_EQ(report.status, MigrationStatus::ManualRequired);
    EXPECT_EQ(report.rule, DecisionRule::UnsafeEscape);
    EXPECT_FALSE(report.job.has_value());
    ASSERT_EQ(report.reasons.size(), 2u);
    EXPECT_EQ(report.reasons[0], "first");
    EXPECT_EQ(report.reasons[1], "second");
}

TEST_F(ReportEmitterTest, EmitLeavesAdvisoriesEmpty) {
    auto report = emit("Any", ManualRequired{});

    EXPECT_TRUE(report.advisories.empty());
    EXPECT_EQ(report.status_tag(), "manual_required");
}
