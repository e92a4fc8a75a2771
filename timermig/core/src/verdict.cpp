#include <timermig/core/verdict.hpp>

namespace timermig::core {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

MigrationStatus status_of(const Verdict& verdict) noexcept {
    return std::visit(
        overloaded{
            [](const Automatic&) { return MigrationStatus::Automatic; },
            [](const ManualRequired&) { return MigrationStatus::ManualRequired; },
            [](const PartialAutomatic&) { return MigrationStatus::PartialAutomatic; },
        },
        verdict);
}

DecisionRule rule_of(const Verdict& verdict) noexcept {
    return std::visit([](const auto& alternative) { return alternative.rule; }, verdict);
}

std::string_view to_string(MigrationStatus status) noexcept {
    switch (status) {
        case MigrationStatus::Automatic:        return "automatic";
        case MigrationStatus::PartialAutomatic: return "partial_automatic";
        case MigrationStatus::ManualRequired:   return "manual_required";
    }
    return "manual_required";
}

std::string_view to_string(DecisionRule rule) noexcept {
    switch (rule) {
        case DecisionRule::MixedPattern:           return "mixed_pattern";
        case DecisionRule::UnsafeEscape:           return "unsafe_escape";
        case DecisionRule::DynamicWithoutSchedule: return "dynamic_without_schedule";
        case DecisionRule::LiteralSchedule:        return "literal_schedule";
        case DecisionRule::UntranslatableSchedule: return "untranslatable_schedule";
        case DecisionRule::ProgrammaticTimer:      return "programmatic_timer";
        case DecisionRule::Unclassified:           return "unclassified";
    }
    return "unclassified";
}

} // namespace timermig::core
