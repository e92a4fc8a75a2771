#include <timermig/core/report.hpp>
#include <timermig/core/verdict.hpp>

#include <gtest/gtest.h>

using namespace timermig::core;

TEST(VerdictTest, StatusOfEachAlternative) {
    EXPECT_EQ(status_of(Verdict{Automatic{}}), MigrationStatus::Automatic);
    EXPECT_EQ(status_of(Verdict{ManualRequired{}}), MigrationStatus::ManualRequired);
    EXPECT_EQ(status_of(Verdict{PartialAutomatic{}}), MigrationStatus::PartialAutomatic);
}

TEST(VerdictTest, RuleOfReturnsRecordedRule) {
    Verdict verdict = ManualRequired{DecisionRule::UnsafeEscape, {"x"}};

    EXPECT_EQ(rule_of(verdict), DecisionRule::UnsafeEscape);
    EXPECT_EQ(rule_index(DecisionRule::UnsafeEscape), 2);
}

TEST(VerdictTest, RuleIndicesFollowTableOrder) {
    EXPECT_EQ(rule_index(DecisionRule::MixedPattern), 1);
    EXPECT_EQ(rule_index(DecisionRule::LiteralSchedule), 4);
    EXPECT_EQ(rule_index(DecisionRule::Unclassified), 7);
}

TEST(VerdictTest, StatusTags) {
    EXPECT_EQ(to_string(MigrationStatus::Automatic), "automatic");
    EXPECT_EQ(to_string(MigrationStatus::PartialAutomatic), "partial_automatic");
    EXPECT_EQ(to_string(MigrationStatus::ManualRequired), "manual_required");
}

TEST(VerdictTest, RuleNames) {
    EXPECT_EQ(to_string(DecisionRule::MixedPattern), "mixed_pattern");
    EXPECT_EQ(to_string(DecisionRule::ProgrammaticTimer), "programmatic_timer");
}

TEST(VerdictTest, EqualityComparesContents) {
    Verdict lhs = ManualRequired{DecisionRule::Unclassified, {"a", "b"}};
    Verdict same = ManualRequired{DecisionRule::Unclassified, {"a", "b"}};
    Verdict reordered = ManualRequired{DecisionRule::Unclassified, {"b", "a"}};

    EXPECT_TRUE(lhs == same);
    EXPECT_FALSE(lhs == reordered);
}

TEST(ReportTest, TriggerWithoutCronIsTbd) {
    TriggerSkeleton trigger;
    trigger.identity = "FooTrigger";

    EXPECT_TRUE(trigger.is_tbd());

    trigger.cron = CronExpression{};
    EXPECT_FALSE(trigger.is_tbd());
}

TEST(ReportTest, StatusTagFollowsStatus) {
    Report report;
    report.status = MigrationStatus::PartialAutomatic;

    EXPECT_EQ(report.status_tag(), "partial_automatic");
}
