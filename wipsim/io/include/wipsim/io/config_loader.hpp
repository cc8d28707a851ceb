#pragma once

/// @file config_loader.hpp
/// @brief Loading run configurations from JSON.
/// @ingroup io_loaders

#include <wipsim/core/run_config.hpp>

#include <filesystem>
#include <string_view>

namespace wipsim::io {

/// @brief Load a run configuration from a JSON file.
///
/// @param path  Filesystem path to the JSON configuration.
/// @return Validated configuration.
///
/// @throws LoaderError  If the file cannot be read or the JSON is invalid.
/// @throws core::InvalidConfigError  If a value violates its constraint.
///
/// @see load_run_config_from_string
core::RunConfig load_run_config(const std::filesystem::path& path);

/// @brief Load a run configuration from a JSON string.
///
/// The root object may contain any of the core::RunConfig field names
/// (`days`, `mean_arrivals_per_day`, `stddev_arrivals_per_day`,
/// `mean_effort`, `stddev_effort`, `min_effort`, `daily_capacity_hours`,
/// `wip_cap_hours_per_ticket`). Missing fields keep their defaults; unknown
/// fields are ignored.
///
/// @param json  JSON content.
/// @return Validated configuration.
///
/// @throws LoaderError  If the JSON is malformed or a field has the wrong type.
/// @throws core::InvalidConfigError  If a value violates its constraint.
core::RunConfig load_run_config_from_string(std::string_view json);

} // namespace wipsim::io
