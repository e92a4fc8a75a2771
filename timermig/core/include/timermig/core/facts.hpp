#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace timermig::core {

/// @brief How a class creates its programmatic timers.
/// @ingroup core_facts
///
/// The values are mutually exclusive except @c Mixed, which stands for any
/// combination of the other creation styles within one class.
enum class TimerPattern {
    Interval,  ///< createIntervalTimer only.
    Single,    ///< createTimer / createSingleActionTimer only.
    Calendar,  ///< createCalendarTimer only.
    Mixed,     ///< More than one creation style in the same class.
    Unknown    ///< Pattern could not be determined by the extractor.
};

/// @brief Observed timer usage of one analysed class.
/// @ingroup core_facts
///
/// A TimerFact is produced once by an external extraction step and treated
/// as an immutable value afterwards. Every member defaults to the value the
/// extractor reports when the corresponding construct is absent.
///
/// @see ScheduleFact, algo::classify
struct TimerFact {
    TimerPattern timer_pattern{TimerPattern::Unknown};  ///< Authoritative creation pattern.
    bool uses_timer_info{false};         ///< Timer.getInfo() is read somewhere.
    bool dynamic_timer_creation{false};  ///< Timers are created outside a fixed startup path.
    uint32_t timeout_method_count{0};    ///< Number of @Timeout callbacks.

    bool uses_timer_handle{false};                   ///< Timer.getHandle() is called.
    bool timer_handle_escapes{false};                ///< The handle is stored, returned or passed on.
    bool uses_timer_handle_param_in_timeout{false};  ///< A handle arrives as a @Timeout parameter.

    bool uses_timer_get_schedule{false};     ///< Timer.getSchedule() is called.
    bool timer_get_schedule_escapes{false};  ///< The schedule object leaves the callback.

    bool has_single_timer{false};    ///< createTimer / createSingleActionTimer seen.
    bool has_interval_timer{false};  ///< createIntervalTimer seen.
    bool has_calendar_timer{false};  ///< createCalendarTimer seen.

    /// Free text for the human reviewer. Never read by the classifier.
    std::string migration_notes;

    bool operator==(const TimerFact&) const = default;
};

/// @brief Wildcard token accepted by every calendar field.
inline constexpr std::string_view kWildcard = "*";

/// @brief Literal @Schedule attributes of one scheduled method.
/// @ingroup core_facts
///
/// Field defaults follow EJB 3.2: second, minute and hour default to "0",
/// every other calendar field to the wildcard. When @c raw_expression is
/// non-empty the calendar fields could not be resolved statically and must
/// not be used for translation.
///
/// @see algo::translate
struct ScheduleFact {
    std::string second{"0"};
    std::string minute{"0"};
    std::string hour{"0"};
    std::string day_of_month{kWildcard};
    std::string month{kWildcard};
    std::string day_of_week{kWildcard};
    std::string year{kWildcard};

    std::string timezone;        ///< Empty: inherit the system default.
    std::string info;            ///< Payload of the original schedule.
    bool persistent{true};       ///< EJB default is persistent.
    std::string raw_expression;  ///< Set when the fields are not literal.

    /// @brief True when the fields are unreliable for translation.
    [[nodiscard]] bool is_non_literal() const noexcept { return !raw_expression.empty(); }

    bool operator==(const ScheduleFact&) const = default;
};

/// @brief Everything the extractor reports about one unit (class).
/// @ingroup core_facts
struct MigrationUnit {
    std::string name;                      ///< Unit identifier, typically the class name.
    TimerFact timer;
    std::optional<ScheduleFact> schedule;  ///< Present for @Schedule methods.

    bool operator==(const MigrationUnit&) const = default;
};

/// @brief Canonical lower-case name of a timer pattern ("interval", "mixed", ...).
[[nodiscard]] std::string_view to_string(TimerPattern pattern) noexcept;

/// @brief Parse a pattern name as written in the original annotations.
///
/// Matching is case-insensitive. An empty string maps to
/// @c TimerPattern::Unknown, as the annotation default is empty.
///
/// @return The pattern, or @c std::nullopt for an unrecognised name.
[[nodiscard]] std::optional<TimerPattern> parse_timer_pattern(std::string_view name);

} // namespace timermig::core
