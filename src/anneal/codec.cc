#include "codec.hh"
#include <charconv>
#include <cmath>

namespace coanneal {

namespace {

constexpr char ROUND_SEPARATOR = ';';
constexpr char VALUE_SEPARATOR = ',';

// Splits "<round>;<rest>"
std::optional<std::pair<round_t, std::string_view>> split_round(std::string_view text) {
    auto sep = text.find(ROUND_SEPARATOR);
    if (sep == std::string_view::npos || sep == 0) {
        return std::nullopt;
    }
    round_t round = 0;
    auto head = text.substr(0, sep);
    auto [ptr, ec] = std::from_chars(head.data(), head.data() + head.size(), round);
    if (ec != std::errc{} || ptr != head.data() + head.size()) {
        return std::nullopt;
    }
    return std::make_pair(round, text.substr(sep + 1));
}

}  // namespace

std::string format_double(double value) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return "nan";
    }
    return std::string(buf, ptr);
}

std::optional<double> parse_double(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string encode_parameters(round_t round, std::span<const double> beta) {
    std::string out = std::to_string(round);
    out.push_back(ROUND_SEPARATOR);
    for (std::size_t i = 0; i < beta.size(); ++i) {
        if (i > 0) {
            out.push_back(VALUE_SEPARATOR);
        }
        out += format_double(beta[i]);
    }
    return out;
}

std::optional<ParameterMessage> decode_parameters(std::string_view text) {
    auto split = split_round(text);
    if (!split || split->second.empty()) {
        return std::nullopt;
    }

    ParameterMessage msg;
    msg.round = split->first;
    auto rest = split->second;
    while (true) {
        auto comma = rest.find(VALUE_SEPARATOR);
        auto value = parse_double(rest.substr(0, comma));
        if (!value) {
            return std::nullopt;
        }
        msg.beta.push_back(*value);
        if (comma == std::string_view::npos) {
            break;
        }
        rest = rest.substr(comma + 1);
    }
    return msg;
}

std::string encode_cost(round_t round, double cost) {
    if (!std::isfinite(cost)) {
        return encode_failure(round);
    }
    return std::to_string(round) + ROUND_SEPARATOR + format_double(cost);
}

std::string encode_failure(round_t round) {
    return std::to_string(round) + ROUND_SEPARATOR + std::string(FAILURE_MARKER);
}

std::optional<CostMessage> decode_cost(std::string_view text) {
    auto split = split_round(text);
    if (!split) {
        return std::nullopt;
    }
    CostMessage msg;
    msg.round = split->first;
    if (split->second == FAILURE_MARKER) {
        return msg;
    }
    auto cost = parse_double(split->second);
    if (!cost) {
        return std::nullopt;
    }
    msg.cost = *cost;
    return msg;
}

std::optional<round_t> peek_round(std::string_view text) {
    auto split = split_round(text);
    if (!split) {
        return std::nullopt;
    }
    return split->first;
}

}  // namespace coanneal
