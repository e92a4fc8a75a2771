#include <timermig/algo/cron_translator.hpp>

#include <timermig/core/cron.hpp>
#include <timermig/core/facts.hpp>

#include <gtest/gtest.h>

using namespace timermig::algo;
using namespace timermig::core;

class CronTranslatorTest : public ::testing::Test {
protected:
    // Every field wildcard except the time of day.
    ScheduleFact at(const std::string& hour, const std::string& minute = "0",
                    const std::string& second = "0") {
        ScheduleFact schedule;
        schedule.second = second;
        schedule.minute = minute;
        schedule.hour = hour;
        return schedule;
    }

    CronExpression expect_cron(const ScheduleFact& schedule) {
        auto result = translate(schedule);
        const auto* cron = std::get_if<CronExpression>(&result);
        EXPECT_NE(cron, nullptr) << std::get<TranslationError>(result).message();
        return cron != nullptr ? *cron : CronExpression{};
    }

    TranslationError expect_error(const ScheduleFact& schedule) {
        auto result = translate(schedule);
        const auto* error = std::get_if<TranslationError>(&result);
        EXPECT_NE(error, nullptr) << "unexpected cron " << std::get<CronExpression>(result).to_string();
        return error != nullptr ? *error : TranslationError{};
    }
};

// =============================================================================
// translate()
// =============================================================================

TEST_F(CronTranslatorTest, NightlyScheduleTranslates) {
    auto cron = expect_cron(at("2"));

    EXPECT_EQ(cron.to_six_field_string(), "0 0 2 * * ?");
    EXPECT_EQ(cron.to_string(), "0 0 2 * * ? *");
    EXPECT_EQ(cron.timezone, "system");
}

TEST_F(CronTranslatorTest, WeekdayScheduleRoundTrips) {
    ScheduleFact schedule;
    schedule.second = "0";
    schedule.minute = "30";
    schedule.hour = "*";
    schedule.day_of_month = "*";
    schedule.month = "*";
    schedule.day_of_week = "MON-FRI";
    schedule.year = "*";

    auto cron = expect_cron(schedule);
    EXPECT_EQ(cron.to_string(), "0 30 * ? * MON-FRI *");

    auto reparsed = parse_cron(cron.to_string(), cron.timezone);
    EXPECT_EQ(reparsed, cron);
    EXPECT_EQ(reparsed.second, schedule.second);
    EXPECT_EQ(reparsed.minute, schedule.minute);
    EXPECT_EQ(reparsed.hour, schedule.hour);
    EXPECT_EQ(reparsed.month, schedule.month);
    EXPECT_EQ(reparsed.day_of_week, schedule.day_of_week);
    EXPECT_EQ(reparsed.year, schedule.year);
}

TEST_F(CronTranslatorTest, TimezoneIsAttached) {
    auto schedule = at("6");
    schedule.timezone = "America/New_York";

    EXPECT_EQ(expect_cron(schedule).timezone, "America/New_York");
}

TEST_F(CronTranslatorTest, DayOfMonthKeptWhenDayOfWeekIsWildcard) {
    auto schedule = at("0");
    schedule.day_of_month = "1,15";

    auto cron = expect_cron(schedule);
    EXPECT_EQ(cron.day_of_month, "1,15");
    EXPECT_EQ(cron.day_of_week, "?");
}

TEST_F(CronTranslatorTest, RestrictingBothDayFieldsFails) {
    auto schedule = at("0");
    schedule.day_of_month = "1";
    schedule.day_of_week = "Mon";

    auto error = expect_error(schedule);
    EXPECT_EQ(error.kind, TranslationErrorKind::UnsupportedToken);
    EXPECT_EQ(error.field, "dayOfWeek");
    EXPECT_EQ(error.value, "Mon");
}

TEST_F(CronTranslatorTest, RawExpressionFailsBeforeFieldsAreRead) {
    auto schedule = at("not-even-valid");
    schedule.raw_expression = "@Schedules({@Schedule(hour = \"1\"), @Schedule(hour = \"2\")})";

    auto error = expect_error(schedule);
    EXPECT_EQ(error.kind, TranslationErrorKind::NonLiteralSchedule);
    EXPECT_EQ(error.value, schedule.raw_expression);
    EXPECT_NE(error.message().find("not a static literal"), std::string::npos);
}

TEST_F(CronTranslatorTest, FirstBadFieldIsReportedVerbatim) {
    auto schedule = at("25", "61");

    auto error = expect_error(schedule);
    EXPECT_EQ(error.kind, TranslationErrorKind::UnsupportedToken);
    EXPECT_EQ(error.field, "minute");
    EXPECT_EQ(error.value, "61");
    EXPECT_EQ(error.message(), "unsupported token in field 'minute': '61'");
}

TEST_F(CronTranslatorTest, MixedMonthRangeIsRenderedNumerically) {
    auto schedule = at("0");
    schedule.month = "JAN-3";

    EXPECT_EQ(expect_cron(schedule).to_string(), "0 0 0 * 1-3 ? *");
}

TEST_F(CronTranslatorTest, YearIsValidated) {
    auto schedule = at("0");
    schedule.year = "2031";
    EXPECT_EQ(expect_cron(schedule).year, "2031");

    schedule.year = "1969";
    EXPECT_EQ(expect_error(schedule).field, "year");
}

TEST_F(CronTranslatorTest, PersistenceAndInfoDoNotAffectCron) {
    auto plain = at("3");
    auto decorated = at("3");
    decorated.persistent = false;
    decorated.info = "payload";

    EXPECT_EQ(expect_cron(plain), expect_cron(decorated));
}

// =============================================================================
// normalize_field()
// =============================================================================

TEST(NormalizeFieldTest, AcceptsGrammar) {
    EXPECT_EQ(normalize_field(CalendarField::Second, "*"), "*");
    EXPECT_EQ(normalize_field(CalendarField::Second, "59"), "59");
    EXPECT_EQ(normalize_field(CalendarField::Minute, "0,15,30,45"), "0,15,30,45");
    EXPECT_EQ(normalize_field(CalendarField::Hour, "9-17"), "9-17");
    EXPECT_EQ(normalize_field(CalendarField::Minute, "*/15"), "*/15");
    EXPECT_EQ(normalize_field(CalendarField::Minute, "5/10"), "5/10");
    EXPECT_EQ(normalize_field(CalendarField::Hour, "8-18/2"), "8-18/2");
}

TEST(NormalizeFieldTest, NormalizesSpelling) {
    EXPECT_EQ(normalize_field(CalendarField::Minute, " 05 "), "5");
    EXPECT_EQ(normalize_field(CalendarField::Month, "jan, Jul"), "JAN,JUL");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "mon-fri"), "MON-FRI");
}

TEST(NormalizeFieldTest, RejectsOutOfDomainValues) {
    EXPECT_FALSE(normalize_field(CalendarField::Second, "60").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "24").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfMonth, "0").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfMonth, "32").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Month, "13").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfWeek, "8").has_value());
}

TEST(NormalizeFieldTest, RejectsTokensOutsideGrammar) {
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "noon").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "1,,2").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "5-1").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "1-2-3").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Minute, "*/0").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Minute, "1/2/3").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Minute, "*,5").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfMonth, "Last").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfMonth, "-3").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfWeek, "?").has_value());
}

TEST(NormalizeFieldTest, NamesOnlyWhereSupported) {
    EXPECT_FALSE(normalize_field(CalendarField::Hour, "MON").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::Month, "MON").has_value());
    EXPECT_FALSE(normalize_field(CalendarField::DayOfWeek, "JAN").has_value());
}

TEST(NormalizeFieldTest, DayOfWeekNumbersAreShiftedToQuartz) {
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "0"), "1");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "7"), "1");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "1-5"), "2-6");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "0-7"), "1-7");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "5-7"), "6-7,1");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "Mon-5"), "2-6");
}

TEST(NormalizeFieldTest, NamesMixedWithNumbersBecomeNumbers) {
    EXPECT_EQ(normalize_field(CalendarField::Month, "JAN-3"), "1-3");
    EXPECT_EQ(normalize_field(CalendarField::Month, "1-mar"), "1-3");
    EXPECT_EQ(normalize_field(CalendarField::Month, "JAN-MAR"), "JAN-MAR");
}

TEST(NormalizeFieldTest, SteppedNamesBecomeNumbers) {
    EXPECT_EQ(normalize_field(CalendarField::Month, "JAN/2"), "1/2");
    EXPECT_EQ(normalize_field(CalendarField::Month, "Jan-Jun/2"), "1-6/2");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "MON/2"), "2/2");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "MON-FRI/2"), "2-6/2");
    EXPECT_EQ(normalize_field(CalendarField::DayOfWeek, "SUN"), "SUN");
}

TEST(NormalizeFieldTest, SteppedWrappingDayRangeIsRejected) {
    EXPECT_FALSE(normalize_field(CalendarField::DayOfWeek, "5-7/2").has_value());
}

TEST(NormalizeFieldTest, FieldNames) {
    EXPECT_EQ(field_name(CalendarField::DayOfMonth), "dayOfMonth");
    EXPECT_EQ(field_name(CalendarField::DayOfWeek), "dayOfWeek");
    EXPECT_EQ(field_name(CalendarField::Year), "year");
}
