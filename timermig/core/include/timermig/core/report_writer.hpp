#pragma once

#include <timermig/core/report.hpp>

namespace timermig::core {

/// @brief Abstract sink for migration reports.
/// @ingroup core
///
/// Implementations serialise reports to a specific format (JSON, text,
/// memory buffer, etc.). A run calls write() once per unit, in unit order,
/// followed by a single finalize().
///
/// Writers are not required to be thread-safe: reports are produced in
/// parallel but sunk from one thread after the batch completes.
///
/// @see io::JsonReportWriter, io::TextualReportWriter
class ReportWriter {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~ReportWriter() = default;

    /// @brief Record the report of one unit.
    /// @param report The report to serialise.
    virtual void write(const Report& report) = 0;

    /// @brief Flush any trailing output.
    ///
    /// Called once after the last write(). The default does nothing.
    virtual void finalize() {}

protected:
    ReportWriter() = default;
    ReportWriter(const ReportWriter&) = default;
    ReportWriter& operator=(const ReportWriter&) = default;
    ReportWriter(ReportWriter&&) = default;
    ReportWriter& operator=(ReportWriter&&) = default;
};

} // namespace timermig::core
