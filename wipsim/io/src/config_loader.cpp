#include <wipsim/io/config_loader.hpp>
#include <wipsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <string>

namespace wipsim::io {

namespace {

constexpr const char* CONTEXT = "config";

// Optional getters: absent keys keep the default, present keys must have the right type
void read_int(const rapidjson::Value& obj, const char* name, int& target) {
    if (!obj.HasMember(name)) {
        return;
    }
    const auto& member = obj[name];
    if (!member.IsInt()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", CONTEXT);
    }
    target = member.GetInt();
}

void read_double(const rapidjson::Value& obj, const char* name, double& target) {
    if (!obj.HasMember(name)) {
        return;
    }
    const auto& member = obj[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", CONTEXT);
    }
    target = member.GetDouble();
}

} // anonymous namespace

core::RunConfig load_run_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_run_config_from_string(oss.str());
}

core::RunConfig load_run_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", CONTEXT);
    }

    core::RunConfig config;
    read_int(doc, "days", config.days);
    read_double(doc, "mean_arrivals_per_day", config.mean_arrivals_per_day);
    read_double(doc, "stddev_arrivals_per_day", config.stddev_arrivals_per_day);
    read_double(doc, "mean_effort", config.mean_effort);
    read_double(doc, "stddev_effort", config.stddev_effort);
    read_int(doc, "min_effort", config.min_effort);
    read_int(doc, "daily_capacity_hours", config.daily_capacity_hours);
    read_int(doc, "wip_cap_hours_per_ticket", config.wip_cap_hours_per_ticket);

    core::validate(config);
    return config;
}

} // namespace wipsim::io
