#include <wipsim/core/run_config.hpp>
#include <wipsim/core/error.hpp>

#include <cmath>

namespace wipsim::core {

namespace {

void require_finite(const char* field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidConfigError(field, "must be a finite number");
    }
}

void require_spread(const char* field, double value) {
    require_finite(field, value);
    if (value < 0.0) {
        throw InvalidConfigError(field, "must not be negative");
    }
}

} // anonymous namespace

void validate(const RunConfig& config) {
    if (config.days < 0) {
        throw InvalidConfigError("days", "must not be negative");
    }
    require_finite("mean_arrivals_per_day", config.mean_arrivals_per_day);
    require_spread("stddev_arrivals_per_day", config.stddev_arrivals_per_day);
    require_finite("mean_effort", config.mean_effort);
    require_spread("stddev_effort", config.stddev_effort);
    if (config.min_effort < 1) {
        throw InvalidConfigError("min_effort", "must be at least 1");
    }
    if (config.daily_capacity_hours < 0) {
        throw InvalidConfigError("daily_capacity_hours", "must not be negative");
    }
    if (config.wip_cap_hours_per_ticket < 1) {
        throw InvalidConfigError("wip_cap_hours_per_ticket", "must be at least 1");
    }
}

} // namespace wipsim::core
