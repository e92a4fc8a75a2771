#include <timermig/algo/error.hpp>

namespace timermig::algo {

std::string TranslationError::message() const {
    switch (kind) {
        case TranslationErrorKind::NonLiteralSchedule:
            return "schedule is not a static literal: " + value;
        case TranslationErrorKind::UnsupportedToken:
            return "unsupported token in field '" + field + "': '" + value + "'";
        case TranslationErrorKind::UnclassifiedPattern:
            break;
    }
    return "unclassified timer usage pattern";
}

std::string_view to_string(TranslationErrorKind kind) noexcept {
    switch (kind) {
        case TranslationErrorKind::NonLiteralSchedule:  return "non_literal_schedule";
        case TranslationErrorKind::UnsupportedToken:    return "unsupported_token";
        case TranslationErrorKind::UnclassifiedPattern: return "unclassified_pattern";
    }
    return "unclassified_pattern";
}

} // namespace timermig::algo
