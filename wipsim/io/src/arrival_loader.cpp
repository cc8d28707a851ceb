#include <wipsim/io/arrival_loader.hpp>
#include <wipsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace wipsim::io {

namespace {

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

int get_int(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsInt()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt();
}

core::DayArrivals parse_day(const rapidjson::Value& entry, core::Day days,
                            const std::string& ctx) {
    if (!entry.IsObject()) {
        throw LoaderError("arrival entry must be an object", ctx);
    }

    core::DayArrivals result;
    result.day = get_int(entry, "day", ctx);
    if (result.day < 0 || result.day >= days) {
        throw LoaderError("day " + std::to_string(result.day) + " outside horizon of " +
                              std::to_string(days) + " days",
                          ctx);
    }

    const auto& efforts = get_member(entry, "efforts", ctx);
    if (!efforts.IsArray()) {
        throw LoaderError("field 'efforts' must be an array", ctx);
    }
    result.efforts.reserve(efforts.Size());
    for (rapidjson::SizeType idx = 0; idx < efforts.Size(); ++idx) {
        if (!efforts[idx].IsInt() || efforts[idx].GetInt() < 0) {
            throw LoaderError("effort must be a non-negative integer",
                              ctx + ".efforts[" + std::to_string(idx) + "]");
        }
        result.efforts.push_back(efforts[idx].GetInt());
    }
    return result;
}

} // anonymous namespace

ArrivalPlan load_arrivals(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_arrivals_from_string(oss.str());
}

ArrivalPlan load_arrivals_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "arrivals");
    }

    ArrivalPlan plan;
    plan.days = get_int(doc, "days", "arrivals");
    if (plan.days < 0) {
        throw LoaderError("field 'days' must not be negative", "arrivals");
    }

    if (!doc.HasMember("arrivals")) {
        // A plan without arrivals is valid
        return plan;
    }
    const auto& entries = doc["arrivals"];
    if (!entries.IsArray()) {
        throw LoaderError("field 'arrivals' must be an array", "arrivals");
    }

    for (rapidjson::SizeType idx = 0; idx < entries.Size(); ++idx) {
        plan.arrivals.push_back(
            parse_day(entries[idx], plan.days, "arrivals[" + std::to_string(idx) + "]"));
    }

    std::sort(plan.arrivals.begin(), plan.arrivals.end(),
              [](const core::DayArrivals& lhs, const core::DayArrivals& rhs) {
                  return lhs.day < rhs.day;
              });
    auto dup = std::adjacent_find(plan.arrivals.begin(), plan.arrivals.end(),
                                  [](const core::DayArrivals& lhs, const core::DayArrivals& rhs) {
                                      return lhs.day == rhs.day;
                                  });
    if (dup != plan.arrivals.end()) {
        throw LoaderError("day " + std::to_string(dup->day) + " listed more than once", "arrivals");
    }

    return plan;
}

void write_arrivals_to_stream(const ArrivalPlan& plan, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("days");
    writer.Int(plan.days);

    writer.Key("arrivals");
    writer.StartArray();
    for (const auto& day : plan.arrivals) {
        writer.StartObject();
        writer.Key("day");
        writer.Int(day.day);
        writer.Key("efforts");
        writer.StartArray();
        for (core::Hours effort : day.efforts) {
            writer.Int(effort);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_arrivals(const ArrivalPlan& plan, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_arrivals_to_stream(plan, file);
}

RecordedArrivals::RecordedArrivals(ArrivalPlan plan)
    : plan_(std::move(plan)) {
    // Plans built in code are not guaranteed to be sorted
    std::stable_sort(plan_.arrivals.begin(), plan_.arrivals.end(),
                     [](const core::DayArrivals& lhs, const core::DayArrivals& rhs) {
                         return lhs.day < rhs.day;
                     });
}

std::vector<core::Hours> RecordedArrivals::arrivals(core::Day day) {
    auto iter = std::lower_bound(plan_.arrivals.begin(), plan_.arrivals.end(), day,
                                 [](const core::DayArrivals& entry, core::Day value) {
                                     return entry.day < value;
                                 });
    if (iter == plan_.arrivals.end() || iter->day != day) {
        return {};
    }
    return iter->efforts;
}

} // namespace wipsim::io
