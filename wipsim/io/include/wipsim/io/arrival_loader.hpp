#pragma once

/// @file arrival_loader.hpp
/// @brief Recorded arrival sequences: JSON loading, writing and replay.
/// @ingroup io_loaders

#include <wipsim/core/arrival_source.hpp>
#include <wipsim/core/types.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

namespace wipsim::io {

/// @brief A complete arrival sequence for a fixed horizon.
///
/// Serialised as
/// `{"days": N, "arrivals": [{"day": d, "efforts": [e, ...]}, ...]}`.
/// Days without an entry have no arrivals.
///
/// @ingroup io_loaders
/// @see load_arrivals, write_arrivals, RecordedArrivals
struct ArrivalPlan {
    core::Day days{0};                         ///< Horizon the plan was recorded for.
    std::vector<core::DayArrivals> arrivals;   ///< Entries sorted by day.
};

/// @brief Load an arrival plan from a JSON file.
///
/// @param path  Filesystem path to the JSON file.
/// @return Parsed plan with entries sorted by day.
///
/// @throws LoaderError  If the file cannot be read or fails validation.
///
/// @see load_arrivals_from_string
ArrivalPlan load_arrivals(const std::filesystem::path& path);

/// @brief Load an arrival plan from a JSON string.
///
/// Rejects malformed JSON, a missing or negative @c days, entries whose day is
/// negative, not below @c days, or repeated, and negative efforts.
///
/// @param json  JSON content describing the plan.
/// @return Parsed plan with entries sorted by day.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
ArrivalPlan load_arrivals_from_string(std::string_view json);

/// @brief Write an arrival plan to an output stream.
/// @param plan  Plan to serialise.
/// @param out   Output stream (file, stringstream, stdout, etc.).
void write_arrivals_to_stream(const ArrivalPlan& plan, std::ostream& out);

/// @brief Write an arrival plan to a JSON file.
/// @param plan  Plan to serialise.
/// @param path  Destination file path.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_arrivals(const ArrivalPlan& plan, const std::filesystem::path& path);

/// @brief ArrivalSource replaying a recorded plan.
///
/// @ingroup io_loaders
/// @see ArrivalPlan, core::ArrivalSource
class RecordedArrivals : public core::ArrivalSource {
public:
    /// @brief Construct a replaying source.
    /// @param plan Plan to replay.
    explicit RecordedArrivals(ArrivalPlan plan);

    /// @brief Return the recorded efforts for @p day.
    /// @param day Day being simulated.
    /// @return Recorded efforts, or an empty vector for days without entries.
    std::vector<core::Hours> arrivals(core::Day day) override;

    /// @brief Access the replayed plan.
    /// @return Plan given at construction.
    [[nodiscard]] const ArrivalPlan& plan() const noexcept { return plan_; }

private:
    ArrivalPlan plan_;
};

} // namespace wipsim::io
