#include <timermig/io/fact_loader.hpp>
#include <timermig/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>

namespace timermig::io {

namespace {

using namespace timermig::core;

// Optional getters: absent members keep the annotation default
void read_bool(const rapidjson::Value& obj, const char* name, const std::string& context,
               bool& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return;
    }
    if (!it->value.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    out = it->value.GetBool();
}

void read_string(const rapidjson::Value& obj, const char* name, const std::string& context,
                 std::string& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return;
    }
    if (!it->value.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    out.assign(it->value.GetString(), it->value.GetStringLength());
}

void read_uint32(const rapidjson::Value& obj, const char* name, const std::string& context,
                 uint32_t& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return;
    }
    if (!it->value.IsUint()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    out = it->value.GetUint();
}

TimerFact parse_timer(const rapidjson::Value& obj, const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("'timer' must be an object", context);
    }

    TimerFact fact;

    std::string pattern_name;
    read_string(obj, "timerPattern", context, pattern_name);
    auto pattern = parse_timer_pattern(pattern_name);
    if (!pattern) {
        throw LoaderError("unknown timerPattern '" + pattern_name + "'", context);
    }
    fact.timer_pattern = *pattern;

    read_bool(obj, "usesTimerInfo", context, fact.uses_timer_info);
    read_bool(obj, "dynamicTimerCreation", context, fact.dynamic_timer_creation);
    read_uint32(obj, "timeoutMethodCount", context, fact.timeout_method_count);
    read_bool(obj, "usesTimerHandle", context, fact.uses_timer_handle);
    read_bool(obj, "timerHandleEscapes", context, fact.timer_handle_escapes);
    read_bool(obj, "usesTimerHandleParamInTimeout", context,
              fact.uses_timer_handle_param_in_timeout);
    read_bool(obj, "usesTimerGetSchedule", context, fact.uses_timer_get_schedule);
    read_bool(obj, "timerGetScheduleEscapes", context, fact.timer_get_schedule_escapes);
    read_bool(obj, "hasSingleTimer", context, fact.has_single_timer);
    read_bool(obj, "hasIntervalTimer", context, fact.has_interval_timer);
    read_bool(obj, "hasCalendarTimer", context, fact.has_calendar_timer);
    read_string(obj, "migrationNotes", context, fact.migration_notes);

    return fact;
}

ScheduleFact parse_schedule(const rapidjson::Value& obj, const std::string& context) {
    if (!obj.IsObject()) {
        throw LoaderError("'schedule' must be an object", context);
    }

    ScheduleFact schedule;
    read_string(obj, "second", context, schedule.second);
    read_string(obj, "minute", context, schedule.minute);
    read_string(obj, "hour", context, schedule.hour);
    read_string(obj, "dayOfMonth", context, schedule.day_of_month);
    read_string(obj, "month", context, schedule.month);
    read_string(obj, "dayOfWeek", context, schedule.day_of_week);
    read_string(obj, "year", context, schedule.year);
    read_string(obj, "timezone", context, schedule.timezone);
    read_string(obj, "info", context, schedule.info);
    read_bool(obj, "persistent", context, schedule.persistent);
    read_string(obj, "rawExpression", context, schedule.raw_expression);
    return schedule;
}

void parse_units_impl(std::vector<MigrationUnit>& result, const rapidjson::Document& doc) {
    auto units_it = doc.FindMember("units");
    if (units_it == doc.MemberEnd()) {
        // Empty fact file is valid
        return;
    }
    const auto& units = units_it->value;
    if (!units.IsArray()) {
        throw LoaderError("field 'units' must be an array", "facts");
    }

    std::unordered_set<std::string> seen;
    for (rapidjson::SizeType uidx = 0; uidx < units.Size(); ++uidx) {
        const auto& unit_obj = units[uidx];
        const std::string ctx = "units[" + std::to_string(uidx) + "]";
        if (!unit_obj.IsObject()) {
            throw LoaderError("unit must be an object", ctx);
        }

        MigrationUnit unit;

        // Name (required)
        auto name_it = unit_obj.FindMember("name");
        if (name_it == unit_obj.MemberEnd()) {
            throw LoaderError("missing required field 'name'", ctx);
        }
        read_string(unit_obj, "name", ctx, unit.name);
        if (unit.name.empty()) {
            throw LoaderError("field 'name' must not be empty", ctx);
        }
        if (!seen.insert(unit.name).second) {
            throw LoaderError("duplicate unit name '" + unit.name + "'", ctx);
        }

        // Timer facts (optional, defaults to an empty fact set)
        if (auto it = unit_obj.FindMember("timer"); it != unit_obj.MemberEnd()) {
            unit.timer = parse_timer(it->value, ctx + ".timer");
        }

        // Schedule facts (optional)
        if (auto it = unit_obj.FindMember("schedule");
            it != unit_obj.MemberEnd() && !it->value.IsNull()) {
            unit.schedule = parse_schedule(it->value, ctx + ".schedule");
        }

        result.push_back(std::move(unit));
    }
}

} // anonymous namespace

std::vector<MigrationUnit> load_units(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_units_from_string(oss.str());
}

std::vector<MigrationUnit> load_units_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "facts");
    }

    std::vector<MigrationUnit> result;
    parse_units_impl(result, doc);
    return result;
}

} // namespace timermig::io
