#include <timermig/algo/cron_translator.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>
#include <vector>

namespace timermig::algo {

namespace {

constexpr std::array<std::string_view, 12> MONTH_NAMES{
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};

// Indexed by EJB day number (Sunday = 0).
constexpr std::array<std::string_view, 7> DAY_NAMES{
    "SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

// Quartz rejects years outside this window.
constexpr int MIN_YEAR = 1970;
constexpr int MAX_YEAR = 2099;

struct FieldDomain {
    int min;
    int max;
};

FieldDomain domain_of(CalendarField field) noexcept {
    switch (field) {
        case CalendarField::Second:     return {0, 59};
        case CalendarField::Minute:     return {0, 59};
        case CalendarField::Hour:       return {0, 23};
        case CalendarField::DayOfMonth: return {1, 31};
        case CalendarField::Month:      return {1, 12};
        case CalendarField::DayOfWeek:  return {0, 7};
        case CalendarField::Year:       return {MIN_YEAR, MAX_YEAR};
    }
    return {0, 0};
}

struct Value {
    int number{0};
    std::string name;  // upper-cased, empty when written as a number

    [[nodiscard]] bool named() const noexcept { return !name.empty(); }
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<int> parse_number(std::string_view text) {
    // Four digits cover every domain, years included.
    if (text.empty() || text.size() > 4) {
        return std::nullopt;
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> lookup_name(CalendarField field, std::string_view upper) {
    if (field == CalendarField::Month) {
        auto it = std::find(MONTH_NAMES.begin(), MONTH_NAMES.end(), upper);
        if (it != MONTH_NAMES.end()) {
            return static_cast<int>(it - MONTH_NAMES.begin()) + 1;
        }
    } else if (field == CalendarField::DayOfWeek) {
        auto it = std::find(DAY_NAMES.begin(), DAY_NAMES.end(), upper);
        if (it != DAY_NAMES.end()) {
            return static_cast<int>(it - DAY_NAMES.begin());
        }
    }
    return std::nullopt;
}

std::optional<Value> parse_value(CalendarField field, std::string_view text) {
    text = trim(text);
    const auto domain = domain_of(field);

    if (auto number = parse_number(text)) {
        if (*number < domain.min || *number > domain.max) {
            return std::nullopt;
        }
        return Value{*number, {}};
    }

    if (text.size() != 3) {
        return std::nullopt;
    }
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (auto number = lookup_name(field, upper)) {
        return Value{*number, std::move(upper)};
    }
    return std::nullopt;
}

// EJB numbers Sunday 0 or 7, Quartz numbers it 1.
int quartz_day(int ejb_day) noexcept {
    return ejb_day % 7 + 1;
}

// Quartz reads a name only on its own or as a name-name range; a step after
// a name is dropped, so stepped or mixed tokens are rendered as numbers.
std::string render_value(CalendarField field, const Value& value, bool keep_name) {
    if (value.named() && keep_name) {
        return value.name;
    }
    if (field == CalendarField::DayOfWeek) {
        return std::to_string(quartz_day(value.number));
    }
    return std::to_string(value.number);
}

std::optional<std::string> render_range(CalendarField field, const Value& from, const Value& to,
                                        bool stepped) {
    if (from.number > to.number) {
        return std::nullopt;
    }
    const bool keep_names = from.named() && to.named() && !stepped;
    if (field != CalendarField::DayOfWeek || keep_names) {
        return render_value(field, from, keep_names) + '-' + render_value(field, to, keep_names);
    }

    if (from.number == 0 && to.number == 7) {
        return std::string("1-7");
    }
    const int first = quartz_day(from.number);
    const int last = quartz_day(to.number);
    if (first <= last) {
        return std::to_string(first) + '-' + std::to_string(last);
    }
    // Range ends on EJB day 7, which wraps to Quartz day 1.
    if (stepped) {
        return std::nullopt;
    }
    return std::to_string(first) + "-7,1";
}

std::optional<std::string> normalize_item(CalendarField field, std::string_view item) {
    item = trim(item);
    std::string_view base = item;
    std::optional<int> step;

    if (auto slash = item.find('/'); slash != std::string_view::npos) {
        base = trim(item.substr(0, slash));
        step = parse_number(trim(item.substr(slash + 1)));
        const auto domain = domain_of(field);
        if (!step || *step < 1 || *step > domain.max - domain.min + 1) {
            return std::nullopt;
        }
    }

    std::string rendered;
    if (base == core::kWildcard) {
        rendered = std::string(core::kWildcard);
    } else if (auto dash = base.find('-'); dash != std::string_view::npos) {
        auto from = parse_value(field, base.substr(0, dash));
        auto to = parse_value(field, base.substr(dash + 1));
        if (!from || !to) {
            return std::nullopt;
        }
        auto range = render_range(field, *from, *to, step.has_value());
        if (!range) {
            return std::nullopt;
        }
        rendered = std::move(*range);
    } else {
        auto value = parse_value(field, base);
        if (!value) {
            return std::nullopt;
        }
        rendered = render_value(field, *value, !step.has_value());
    }

    if (step) {
        rendered += '/';
        rendered += std::to_string(*step);
    }
    return rendered;
}

} // anonymous namespace

std::string_view field_name(CalendarField field) noexcept {
    switch (field) {
        case CalendarField::Second:     return "second";
        case CalendarField::Minute:     return "minute";
        case CalendarField::Hour:       return "hour";
        case CalendarField::DayOfMonth: return "dayOfMonth";
        case CalendarField::Month:      return "month";
        case CalendarField::DayOfWeek:  return "dayOfWeek";
        case CalendarField::Year:       return "year";
    }
    return "";
}

std::optional<std::string> normalize_field(CalendarField field, std::string_view token) {
    token = trim(token);
    if (token.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> items;
    std::size_t start = 0;
    while (true) {
        const auto comma = token.find(',', start);
        const auto length = comma == std::string_view::npos ? std::string_view::npos : comma - start;
        auto item = normalize_item(field, token.substr(start, length));
        if (!item) {
            return std::nullopt;
        }
        items.push_back(std::move(*item));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    // A wildcard only stands alone.
    if (items.size() > 1 &&
        std::find(items.begin(), items.end(), core::kWildcard) != items.end()) {
        return std::nullopt;
    }

    std::string joined = items.front();
    for (std::size_t idx = 1; idx < items.size(); ++idx) {
        joined += ',';
        joined += items[idx];
    }
    return joined;
}

TranslationResult translate(const core::ScheduleFact& schedule) {
    if (schedule.is_non_literal()) {
        return TranslationError{TranslationErrorKind::NonLiteralSchedule, {}, schedule.raw_expression};
    }

    const std::array<std::pair<CalendarField, const std::string*>, 7> fields{{
        {CalendarField::Second, &schedule.second},
        {CalendarField::Minute, &schedule.minute},
        {CalendarField::Hour, &schedule.hour},
        {CalendarField::DayOfMonth, &schedule.day_of_month},
        {CalendarField::Month, &schedule.month},
        {CalendarField::DayOfWeek, &schedule.day_of_week},
        {CalendarField::Year, &schedule.year},
    }};

    std::array<std::string, 7> normalized;
    for (std::size_t idx = 0; idx < fields.size(); ++idx) {
        const auto& [field, token] = fields[idx];
        auto result = normalize_field(field, *token);
        if (!result) {
            return TranslationError{TranslationErrorKind::UnsupportedToken,
                                    std::string(field_name(field)), *token};
        }
        normalized[idx] = std::move(*result);
    }

    core::CronExpression cron;
    cron.second = std::move(normalized[0]);
    cron.minute = std::move(normalized[1]);
    cron.hour = std::move(normalized[2]);
    cron.month = std::move(normalized[4]);
    cron.year = std::move(normalized[6]);

    if (normalized[5] == core::kWildcard) {
        cron.day_of_month = std::move(normalized[3]);
        cron.day_of_week = "?";
    } else if (normalized[3] == core::kWildcard) {
        cron.day_of_month = "?";
        cron.day_of_week = std::move(normalized[5]);
    } else {
        return TranslationError{TranslationErrorKind::UnsupportedToken,
                                std::string(field_name(CalendarField::DayOfWeek)),
                                schedule.day_of_week};
    }

    cron.timezone = schedule.timezone.empty() ? std::string(core::kSystemTimezone)
                                              : schedule.timezone;
    return cron;
}

} // namespace timermig::algo
