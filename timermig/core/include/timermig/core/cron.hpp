#pragma once

#include <string>
#include <string_view>

namespace timermig::core {

/// @brief Timezone marker used when a schedule does not name one.
inline constexpr std::string_view kSystemTimezone = "system";

/// @brief Normalized seven-field Quartz cron expression.
/// @ingroup core_cron
///
/// Field order is `second minute hour dayOfMonth month dayOfWeek year`.
/// Exactly one of @c day_of_month and @c day_of_week holds the Quartz
/// "no specific value" marker `?`. The timezone is kept beside the
/// expression since Quartz configures it on the trigger, not in the string.
///
/// Instances are produced by algo::translate or parse_cron; the struct
/// itself does not re-validate field contents.
///
/// @see parse_cron, algo::translate
struct CronExpression {
    std::string second;
    std::string minute;
    std::string hour;
    std::string day_of_month;
    std::string month;
    std::string day_of_week;
    std::string year{"*"};
    std::string timezone{kSystemTimezone};

    /// @brief Render as a single space-separated seven-field string.
    /// @return e.g. `"0 0 2 * * ? *"`.
    [[nodiscard]] std::string to_string() const;

    /// @brief Render the six leading fields, omitting the optional year.
    /// @return e.g. `"0 0 2 * * ?"`.
    [[nodiscard]] std::string to_six_field_string() const;

    bool operator==(const CronExpression&) const = default;
};

/// @brief Parse a normalized cron string back into its fields.
///
/// Accepts six fields (year defaults to `*`) or seven fields separated by
/// any run of blanks. Field contents are copied verbatim.
///
/// @param text      Cron string as produced by CronExpression::to_string().
/// @param timezone  Timezone to attach to the result.
/// @return The parsed expression.
/// @throws InvalidCronError  If the field count is not six or seven.
[[nodiscard]] CronExpression parse_cron(std::string_view text,
                                        std::string_view timezone = kSystemTimezone);

} // namespace timermig::core
