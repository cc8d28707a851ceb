#include <wipsim/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>

namespace wipsim::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::Day /*day*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    if (!finalized_) {
        finalize();
    }
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::begin(core::Day day) {
    writer_.StartObject();
    key("day");
    writer_.Int(day);
}

void JsonTraceWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view name, double value) {
    key(name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view name, uint64_t value) {
    key(name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view name, std::string_view value) {
    key(name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    writer_.EndObject();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    writer_.EndArray();
    output_ << "\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::Day day) {
    current_ = TraceRecord{};
    current_.day = day;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output)
    : output_(output) {}

void TextualTraceWriter::begin(core::Day day) {
    current_day_ = day;
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

void TextualTraceWriter::end() {
    // Format: [day   n]   event_name: key = value, key = value
    output_ << "[day " << std::setw(4) << current_day_ << "] "
            << std::setw(16) << std::right << current_type_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }
    output_ << "\n";
}

} // namespace wipsim::io
