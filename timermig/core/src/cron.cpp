#include <timermig/core/cron.hpp>
#include <timermig/core/error.hpp>

#include <sstream>
#include <vector>

namespace timermig::core {

std::string CronExpression::to_string() const {
    return to_six_field_string() + ' ' + year;
}

std::string CronExpression::to_six_field_string() const {
    std::string out;
    out.reserve(32);
    out += second;
    out += ' ';
    out += minute;
    out += ' ';
    out += hour;
    out += ' ';
    out += day_of_month;
    out += ' ';
    out += month;
    out += ' ';
    out += day_of_week;
    return out;
}

CronExpression parse_cron(std::string_view text, std::string_view timezone) {
    std::istringstream iss{std::string(text)};
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
    }

    if (fields.size() != 6 && fields.size() != 7) {
        throw InvalidCronError("cron expression '" + std::string(text) + "' has " +
                               std::to_string(fields.size()) + " fields, expected 6 or 7");
    }

    CronExpression cron;
    cron.second = fields[0];
    cron.minute = fields[1];
    cron.hour = fields[2];
    cron.day_of_month = fields[3];
    cron.month = fields[4];
    cron.day_of_week = fields[5];
    if (fields.size() == 7) {
        cron.year = fields[6];
    }
    cron.timezone = std::string(timezone);
    return cron;
}

} // namespace timermig::core
