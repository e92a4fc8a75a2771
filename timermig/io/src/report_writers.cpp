#include <timermig/io/report_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>

namespace timermig::io {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_key(JsonWriter& writer, std::string_view key) {
    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
}

void write_strings(JsonWriter& writer, std::string_view key, const std::vector<std::string>& values) {
    write_key(writer, key);
    writer.StartArray();
    for (const auto& value : values) {
        write_string(writer, value);
    }
    writer.EndArray();
}

void write_job(JsonWriter& writer, const core::JobSkeleton& job) {
    writer.StartObject();
    write_key(writer, "name");
    write_string(writer, job.name);
    write_key(writer, "group");
    write_string(writer, job.group);
    write_key(writer, "durable");
    writer.Bool(job.durable);

    write_key(writer, "trigger");
    writer.StartObject();
    write_key(writer, "name");
    write_string(writer, job.trigger.identity);
    write_key(writer, "cron");
    if (job.trigger.is_tbd()) {
        write_string(writer, core::kTriggerTbd);
    } else {
        write_string(writer, job.trigger.cron->to_string());
        write_key(writer, "timezone");
        write_string(writer, job.trigger.cron->timezone);
    }
    writer.EndObject();

    write_key(writer, "data");
    writer.StartObject();
    for (const auto& [key, value] : job.data) {
        write_key(writer, key);
        write_string(writer, value);
    }
    writer.EndObject();

    writer.EndObject();
}

void write_report(JsonWriter& writer, const core::Report& report) {
    writer.StartObject();
    write_key(writer, "unit");
    write_string(writer, report.unit_name);
    write_key(writer, "status");
    write_string(writer, report.status_tag());
    write_key(writer, "rule");
    writer.Int(core::rule_index(report.rule));
    write_key(writer, "ruleName");
    write_string(writer, core::to_string(report.rule));
    if (report.job) {
        write_key(writer, "job");
        write_job(writer, *report.job);
    }
    write_strings(writer, "reasons", report.reasons);
    write_strings(writer, "advisories", report.advisories);
    writer.EndObject();
}

void write_summary(JsonWriter& writer, const MigrationSummary& summary) {
    writer.StartObject();
    write_key(writer, "total");
    writer.Uint64(summary.total);
    write_key(writer, "automatic");
    writer.Uint64(summary.automatic);
    write_key(writer, "partial_automatic");
    writer.Uint64(summary.partial_automatic);
    write_key(writer, "manual_required");
    writer.Uint64(summary.manual_required);
    write_key(writer, "with_advisories");
    writer.Uint64(summary.with_advisories);
    write_key(writer, "rules");
    writer.StartObject();
    for (const auto& [rule, count] : summary.per_rule) {
        write_key(writer, core::to_string(rule));
        writer.Uint64(count);
    }
    writer.EndObject();
    writer.EndObject();
}

} // anonymous namespace

// =============================================================================
// NullReportWriter
// =============================================================================

void NullReportWriter::write(const core::Report& /*report*/) {}

// =============================================================================
// JsonReportWriter
// =============================================================================

JsonReportWriter::JsonReportWriter(std::ostream& output, bool include_summary)
    : output_(output)
    , include_summary_(include_summary) {}

JsonReportWriter::~JsonReportWriter() {
    if (!finalized_) {
        finalize();
    }
}

void JsonReportWriter::write(const core::Report& report) {
    reports_.push_back(report);
}

void JsonReportWriter::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    write_key(writer, "reports");
    writer.StartArray();
    for (const auto& report : reports_) {
        write_report(writer, report);
    }
    writer.EndArray();
    if (include_summary_) {
        write_key(writer, "summary");
        write_summary(writer, compute_summary(reports_));
    }
    writer.EndObject();

    output_ << buffer.GetString() << '\n';
    output_.flush();
}

// =============================================================================
// MemoryReportWriter
// =============================================================================

void MemoryReportWriter::write(const core::Report& report) {
    reports_.push_back(report);
}

// =============================================================================
// TextualReportWriter
// =============================================================================

TextualReportWriter::TextualReportWriter(std::ostream& output, bool include_summary)
    : output_(output)
    , include_summary_(include_summary) {}

void TextualReportWriter::write(const core::Report& report) {
    summary_.add(report);

    output_ << '[' << report.status_tag() << "] " << report.unit_name
            << " (rule " << core::rule_index(report.rule) << ": " << core::to_string(report.rule)
            << ")\n";

    if (report.job) {
        const auto& job = *report.job;
        output_ << "  job       " << job.name << " (group " << job.group << ", "
                << (job.durable ? "durable" : "non-durable") << ")\n";
        output_ << "  trigger   " << job.trigger.identity << ' ';
        if (job.trigger.is_tbd()) {
            output_ << core::kTriggerTbd << '\n';
        } else {
            output_ << "cron \"" << job.trigger.cron->to_string() << "\" tz "
                    << job.trigger.cron->timezone << '\n';
        }
        for (const auto& [key, value] : job.data) {
            output_ << "  data      " << key << '=' << value << '\n';
        }
    }
    for (const auto& reason : report.reasons) {
        output_ << "  reason    " << reason << '\n';
    }
    for (const auto& advisory : report.advisories) {
        output_ << "  advisory  " << advisory << '\n';
    }
}

void TextualReportWriter::finalize() {
    if (include_summary_) {
        output_ << summary_.total << " units: " << summary_.automatic << " automatic, "
                << summary_.partial_automatic << " partial_automatic, "
                << summary_.manual_required << " manual_required\n";
        for (const auto& [rule, count] : summary_.per_rule) {
            output_ << "  rule " << core::rule_index(rule) << ' ' << core::to_string(rule)
                    << ": " << count << '\n';
        }
    }
    output_.flush();
}

} // namespace timermig::io
