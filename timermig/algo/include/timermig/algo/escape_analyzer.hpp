#pragma once

/// @file escape_analyzer.hpp
/// @brief Escape rules for timer handles and schedule objects.
/// @ingroup algo_escape

#include <timermig/core/facts.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace timermig::algo {

/// @brief Reason reported when a timer handle may outlive its scope.
inline constexpr std::string_view kHandleEscapeReason = "handle lifetime not provably local";

/// @brief Reason reported when a schedule object may outlive its scope.
inline constexpr std::string_view kScheduleEscapeReason =
    "schedule object lifetime not provably local";

/// @brief Result of an escape rule: safe, or unsafe with a reason.
/// @ingroup algo_escape
class EscapeVerdict {
public:
    /// @brief The value stays within a provably local scope.
    [[nodiscard]] static EscapeVerdict safe() { return EscapeVerdict{}; }

    /// @brief The value may escape.
    /// @param reason Human-readable explanation, reported verbatim.
    [[nodiscard]] static EscapeVerdict unsafe(std::string_view reason) {
        return EscapeVerdict{std::string(reason)};
    }

    [[nodiscard]] bool is_safe() const noexcept { return reason_.empty(); }

    /// @brief Explanation of an unsafe verdict; empty when safe.
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

    bool operator==(const EscapeVerdict&) const = default;

private:
    EscapeVerdict() = default;
    explicit EscapeVerdict(std::string reason) : reason_(std::move(reason)) {}

    std::string reason_;
};

/// @brief Decide whether timer-handle usage stays local.
///
/// Safe when no handle is used, or when a handle is used but neither
/// escapes its method nor arrives as a @Timeout parameter.
///
/// @return Safe, or Unsafe(@ref kHandleEscapeReason).
[[nodiscard]] EscapeVerdict analyze_handle_escape(const core::TimerFact& fact);

/// @brief Decide whether schedule introspection stays local.
///
/// Safe when getSchedule() is not used, or when its result never leaves
/// the timeout callback.
///
/// @return Safe, or Unsafe(@ref kScheduleEscapeReason).
[[nodiscard]] EscapeVerdict analyze_schedule_escape(const core::TimerFact& fact);

} // namespace timermig::algo
