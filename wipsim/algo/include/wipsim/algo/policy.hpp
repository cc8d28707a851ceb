#pragma once

#include <wipsim/core/ticket.hpp>
#include <wipsim/core/types.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace wipsim::algo {

/// @brief The closed set of scheduling policies.
/// @ingroup algo_policies
///
/// Every policy spends the same daily capacity; they differ only in the order
/// in which open tickets are served and in how many hours one ticket may get
/// per pass.
enum class PolicyKind {
    EqualWorking,             ///< Arrival order, capped offer, uncapped second pass.
    OldestFirst,              ///< Arrival order, uncapped (FIFO).
    ShortestFirst,            ///< Ascending remaining effort (SJF).
    OldestShortestFirst,      ///< Ascending start day, then remaining effort (OSJF).
    AgeWeightedShortestFirst  ///< Ascending remaining / age, integer division (AWSJF).
};

/// @brief All policy kinds in reporting order.
/// @ingroup algo_policies
inline constexpr std::array<PolicyKind, 5> ALL_POLICIES{
    PolicyKind::EqualWorking,
    PolicyKind::OldestFirst,
    PolicyKind::ShortestFirst,
    PolicyKind::OldestShortestFirst,
    PolicyKind::AgeWeightedShortestFirst};

/// @brief Human-readable policy name used in reports.
/// @param kind Policy kind.
/// @return Display name, e.g. "Oldest, shortest first".
[[nodiscard]] std::string_view policy_name(PolicyKind kind) noexcept;

/// @brief Short key used on the command line and in JSON output.
/// @param kind Policy kind.
/// @return One of "equal", "fifo", "sjf", "osjf", "awsjf".
[[nodiscard]] std::string_view policy_key(PolicyKind kind) noexcept;

/// @brief Look up a policy by its short key.
/// @param key Key as returned by policy_key().
/// @return The matching kind, or std::nullopt for an unknown key.
[[nodiscard]] std::optional<PolicyKind> parse_policy(std::string_view key) noexcept;

/// @brief A scheduling policy bound to its capacity parameters.
/// @ingroup algo_policies
///
/// A Policy is a stateless daily step: allocate() distributes the daily
/// capacity over a population of tickets by calling core::Ticket::burn in
/// policy order. Dispatch on the kind is a plain switch; there is no
/// virtual interface because the set of policies is closed.
///
/// Sorted policies use a stable sort over arrival order, so tickets with
/// equal keys are served in arrival (ticket id) order.
///
/// @see Simulation, core::Ticket::burn
class Policy {
public:
    /// @brief Construct a policy.
    /// @param kind           Which ordering and offer rule to apply.
    /// @param daily_capacity Hours available per day.
    /// @param wip_cap        First-pass cap per ticket (EqualWorking only).
    Policy(PolicyKind kind, core::Hours daily_capacity, core::Hours wip_cap);

    /// @brief Get the policy kind.
    /// @return Kind selected at construction.
    [[nodiscard]] PolicyKind kind() const noexcept { return kind_; }

    /// @brief Get the daily capacity.
    /// @return Hours available per day.
    [[nodiscard]] core::Hours daily_capacity() const noexcept { return daily_capacity_; }

    /// @brief Get the per-ticket first-pass cap.
    /// @return Hours offered per ticket in the capped pass.
    [[nodiscard]] core::Hours wip_cap() const noexcept { return wip_cap_; }

    /// @brief Get the display name.
    /// @return Same as policy_name(kind()).
    [[nodiscard]] std::string_view name() const noexcept { return policy_name(kind_); }

    /// @brief Burn one day of capacity into a ticket population.
    ///
    /// Every ticket in @p tickets gets its carry-forward for `day + 1`
    /// written, whether or not it received work.
    ///
    /// @param day     Current day; every ticket must have arrived by then.
    /// @param tickets Population, in arrival order.
    /// @return Hours spent per ticket, indexed like @p tickets.
    /// @throws core::OutOfRangeError if a ticket cannot be burned on @p day.
    std::vector<core::Hours> allocate(core::Day day, std::vector<core::Ticket>& tickets) const;

private:
    /// @brief Indices of @p tickets in the order this policy serves them.
    [[nodiscard]] std::vector<std::size_t> service_order(
        core::Day day, const std::vector<core::Ticket>& tickets) const;

    PolicyKind kind_;
    core::Hours daily_capacity_;
    core::Hours wip_cap_;
};

} // namespace wipsim::algo
