#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// Provides a no-op writer, a streaming JSON writer built on RapidJSON, an
/// in-memory buffer for tests and post-processing, and a human-readable
/// one-line-per-event writer.
///
/// @ingroup io_writers

#include <wipsim/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace wipsim::io {

/// @brief Trace writer that silently discards all events.
///
/// @ingroup io_writers
/// @see core::TraceWriter
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams a JSON array to an output stream.
///
/// Each record becomes one object `{"day": d, "type": "...", fields...}`.
/// Call @ref finalize to close the array once the run is complete; the
/// destructor does it otherwise.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array and flush the stream.
    ///
    /// Safe to call more than once; only the first call writes.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    core::Day day{0};   ///< Simulated day of the event.
    std::string type;   ///< Event type identifier (e.g. "burn").
    /// @brief Named fields attached to the event.
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;
};

/// @brief Trace writer that buffers all events in memory as @ref TraceRecord objects.
///
/// @ingroup io_writers
/// @see TraceRecord, JsonTraceWriter
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Access the accumulated trace records.
    /// @return Const reference to the internal record vector.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace writer, one aligned line per event.
///
/// Lines look like `[day   3]             burn: policy = sjf, ticket = 2`.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit TextualTraceWriter(std::ostream& output);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::Day day) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::Day current_day_{0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace wipsim::io
