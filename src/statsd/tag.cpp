#include "statsd/tag.hpp"
#include <cmath>
#include <cstdint>
#include <spdlog/fmt/fmt.h>

namespace hoststatsd::statsd {

std::string format_number(double value) {
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<int64_t>(value));
    }
    return fmt::format("{}", value);
}

std::string sanitize(const std::string& input) {
    std::string out = input;
    for (auto& c : out) {
        switch (c) {
            case '.':
            case ' ':
            case ':':
            case '|':
            case '\n':
            case '\r':
            case '\t':
                c = '-';
                break;
            default:
                break;
        }
    }
    return out;
}

Tag::Tag(const std::string& name, const std::string& value)
    : name_(sanitize(name)),
      value_(sanitize(value)) {}

Tag make_tag(const std::string& name, const std::string& value) {
    return Tag(name, value);
}

} // namespace hoststatsd::statsd
