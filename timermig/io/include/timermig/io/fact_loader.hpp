#pragma once

/// @file fact_loader.hpp
/// @brief Loading extracted timer facts from JSON.
/// @ingroup io_loaders

#include <timermig/core/facts.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace timermig::io {

/// @brief Load migration units from a JSON file.
///
/// Expected layout:
/// @code{.json}
/// {
///   "units": [{
///     "name": "ReportScheduler",
///     "timer": {"timerPattern": "single", "hasSingleTimer": true, "timeoutMethodCount": 1},
///     "schedule": {"hour": "2", "minute": "0", "second": "0"}
///   }]
/// }
/// @endcode
///
/// Keys of @c timer and @c schedule use the annotation attribute names and
/// are all optional, defaulting to the annotation defaults. @c schedule may
/// be omitted or null for units without a @Schedule method.
///
/// @param path  Filesystem path to the JSON fact file.
/// @return Units in file order.
///
/// @throws LoaderError  If the file cannot be read or fails validation.
///
/// @see load_units_from_string
std::vector<core::MigrationUnit> load_units(const std::filesystem::path& path);

/// @brief Load migration units from a JSON string.
///
/// @param json  JSON content in the layout described by load_units().
/// @return Units in document order.
///
/// @throws LoaderError  If the JSON is malformed, a field has the wrong
///                      type, a pattern name is unknown, a unit name is
///                      missing or empty, or two units share a name.
std::vector<core::MigrationUnit> load_units_from_string(std::string_view json);

} // namespace timermig::io
