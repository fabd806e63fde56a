#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace coanneal {

// ============================================================================
// Round-tagged parameter and cost messages
// ============================================================================
//
// Parameters:  "<round>;<b1>,<b2>,...,<bn>"
// Cost:        "<round>;<cost>"   or   "<round>;error"
//
// Numbers use the shortest form that parses back to the same double.
// Every evaluation gets a fresh round so a reader can tell a stale value from
// the one it is waiting for.

using round_t = std::uint64_t;

inline constexpr std::string_view PARAMETER_KEY = "betas";
inline constexpr std::string_view COST_KEY = "cost";
inline constexpr std::string_view FAILURE_MARKER = "error";

struct ParameterMessage {
    round_t round = 0;
    std::vector<double> beta;
};

struct CostMessage {
    round_t round = 0;
    std::optional<double> cost;    // nullopt: the worker reported a failure

    [[nodiscard]] bool failed() const { return !cost.has_value(); }
};

[[nodiscard]] std::string encode_parameters(round_t round, std::span<const double> beta);
[[nodiscard]] std::optional<ParameterMessage> decode_parameters(std::string_view text);

[[nodiscard]] std::string encode_cost(round_t round, double cost);
[[nodiscard]] std::string encode_failure(round_t round);
[[nodiscard]] std::optional<CostMessage> decode_cost(std::string_view text);

// Round prefix of either message kind
[[nodiscard]] std::optional<round_t> peek_round(std::string_view text);

[[nodiscard]] std::string format_double(double value);
[[nodiscard]] std::optional<double> parse_double(std::string_view text);

}  // namespace coanneal
