#pragma once

/// @file report_writers.hpp
/// @brief Concrete ReportWriter implementations for migration output.
///
/// Provides a no-op writer, a JSON writer built on rapidjson, an in-memory
/// buffer for tests and post-processing, and a human-readable textual
/// writer.
///
/// @ingroup io_writers

#include <timermig/core/report_writer.hpp>
#include <timermig/io/summary.hpp>

#include <ostream>
#include <vector>

namespace timermig::io {

/// @brief Report writer that silently discards all reports.
///
/// @ingroup io_writers
/// @see core::ReportWriter
class NullReportWriter : public core::ReportWriter {
public:
    void write(const core::Report& report) override;
};

/// @brief Report writer producing a single JSON document.
///
/// The document is `{"reports": [...]}`, followed by a `"summary"` member
/// when requested. Reports are buffered and serialised to the stream by
/// @ref finalize, which the destructor calls if needed.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::ReportWriter, TextualReportWriter
class JsonReportWriter : public core::ReportWriter {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output           Destination stream (must outlive this writer).
    /// @param include_summary  Append per-status and per-rule counts.
    explicit JsonReportWriter(std::ostream& output, bool include_summary = false);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonReportWriter() override;

    JsonReportWriter(const JsonReportWriter&) = delete;
    JsonReportWriter& operator=(const JsonReportWriter&) = delete;
    JsonReportWriter(JsonReportWriter&&) = delete;
    JsonReportWriter& operator=(JsonReportWriter&&) = delete;

    /// @brief Append one report object to the "reports" array.
    void write(const core::Report& report) override;

    /// @brief Close the document and write it to the stream.
    ///
    /// Subsequent calls do nothing.
    void finalize() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool include_summary_;
    bool finalized_{false};
    std::vector<core::Report> reports_;
};

/// @brief Report writer that buffers all reports in memory.
///
/// @ingroup io_writers
/// @see compute_summary
class MemoryReportWriter : public core::ReportWriter {
public:
    void write(const core::Report& report) override;

    /// @brief Access the accumulated reports.
    [[nodiscard]] const std::vector<core::Report>& reports() const { return reports_; }

    /// @brief Discard all buffered reports.
    void clear() { reports_.clear(); }

private:
    std::vector<core::Report> reports_;
};

/// @brief Human-readable report writer, one block per unit.
///
/// Each block starts with the status tag and unit name, followed by one
/// indented line per job, trigger, data entry, reason and advisory.
///
/// @ingroup io_writers
/// @see core::ReportWriter, JsonReportWriter
class TextualReportWriter : public core::ReportWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output           Destination stream (must outlive this writer).
    /// @param include_summary  Print per-status and per-rule counts on finalize.
    explicit TextualReportWriter(std::ostream& output, bool include_summary = false);

    TextualReportWriter(const TextualReportWriter&) = delete;
    TextualReportWriter& operator=(const TextualReportWriter&) = delete;
    TextualReportWriter(TextualReportWriter&&) = delete;
    TextualReportWriter& operator=(TextualReportWriter&&) = delete;

    void write(const core::Report& report) override;
    void finalize() override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool include_summary_;
    MigrationSummary summary_;
};

} // namespace timermig::io
