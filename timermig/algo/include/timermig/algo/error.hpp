#pragma once

#include <string>
#include <string_view>

namespace timermig::algo {

/// @brief Category of a per-unit classification failure.
/// @ingroup algo
///
/// None of these is fatal to a run; they are surfaced in the unit's
/// verdict and never retried.
enum class TranslationErrorKind {
    NonLiteralSchedule,  ///< Schedule fields are computed at runtime.
    UnsupportedToken,    ///< A field holds a token outside the accepted grammar.
    UnclassifiedPattern  ///< No decision rule matched (catch-all row).
};

/// @brief Failure value returned by translate().
/// @ingroup algo
///
/// Carries the offending field and token verbatim so that the reason shown
/// to a reviewer can be traced back to the source annotation.
///
/// @see translate, TranslationResult
struct TranslationError {
    TranslationErrorKind kind{TranslationErrorKind::UnsupportedToken};
    std::string field;  ///< Calendar field name ("dayOfWeek", ...); empty for NonLiteralSchedule.
    std::string value;  ///< Offending token, or the raw expression.

    /// @brief Human-readable description used as a ManualRequired reason.
    [[nodiscard]] std::string message() const;

    bool operator==(const TranslationError&) const = default;
};

/// @brief Short identifier of an error kind, e.g. "unsupported_token".
[[nodiscard]] std::string_view to_string(TranslationErrorKind kind) noexcept;

} // namespace timermig::algo
