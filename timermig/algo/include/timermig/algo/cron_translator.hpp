#pragma once

/// @file cron_translator.hpp
/// @brief Translation of literal @Schedule fields into Quartz cron expressions.
/// @ingroup algo_translator

#include <timermig/algo/error.hpp>
#include <timermig/core/cron.hpp>
#include <timermig/core/facts.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace timermig::algo {

/// @brief Calendar fields of a schedule, in cron order.
/// @ingroup algo_translator
enum class CalendarField {
    Second,
    Minute,
    Hour,
    DayOfMonth,
    Month,
    DayOfWeek,
    Year
};

/// @brief Annotation attribute name of a field ("second", "dayOfMonth", ...).
[[nodiscard]] std::string_view field_name(CalendarField field) noexcept;

/// @brief Outcome of translate(): a cron expression or the reason it failed.
/// @ingroup algo_translator
using TranslationResult = std::variant<core::CronExpression, TranslationError>;

/// @brief Validate one field token and rewrite it in Quartz form.
///
/// Accepted grammar, per comma-separated item: `*`, a value, a range
/// `a-b` with `a <= b`, or a step `x/n` where `x` is `*`, a value or a
/// range. Values are integers in the field's domain; month and day-of-week
/// also accept three-letter English names in any case.
///
/// Rewriting upper-cases names, drops blanks around items, strips leading
/// zeros and renumbers numeric day-of-week values from the EJB convention
/// (0 and 7 are Sunday) to the Quartz one (1 is Sunday). Names survive only
/// alone or in a name-name range; a name mixed with a number or followed by
/// a step is rewritten as its number.
///
/// @param field  Which field the token belongs to.
/// @param token  Raw token as written in the annotation.
/// @return Normalized token, or @c std::nullopt if the token is outside
///         the grammar or the field's domain.
[[nodiscard]] std::optional<std::string> normalize_field(CalendarField field,
                                                         std::string_view token);

/// @brief Translate a literal schedule into a seven-field Quartz cron expression.
/// @ingroup algo_translator
///
/// Fails with @c NonLiteralSchedule when @c raw_expression is set, without
/// looking at the calendar fields. Otherwise every field is normalized with
/// normalize_field() in cron order and the first failure is reported as
/// @c UnsupportedToken with the field name and the token verbatim.
///
/// Quartz requires exactly one of day-of-month and day-of-week to be `?`:
/// a wildcard day-of-week becomes `?`; otherwise day-of-month must be a
/// wildcard and becomes `?`. A schedule restricting both fails on
/// `dayOfWeek`.
///
/// The timezone is attached as-is, or @ref core::kSystemTimezone when empty.
///
/// @param schedule  Facts of one @Schedule method.
/// @return The expression, or the first failure found.
[[nodiscard]] TranslationResult translate(const core::ScheduleFact& schedule);

} // namespace timermig::algo
