/**
 * statsd line encoder
 *
 * Produces one line of the statsd/opentsdb wire format:
 *
 *   <metric>.<prefix><tag>.<value>. ... .<prefix>hostname.<host>:<value>|<type>
 *
 * Lines are joined with '\n' by the transport into a single datagram.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "statsd/tag.hpp"

namespace hoststatsd::statsd {

enum class MetricType {
    COUNTER,    // c
    SET,        // s
    GAUGE,      // g
    TIMER       // ms
};

inline const char* metric_type_code(MetricType type) {
    switch (type) {
        case MetricType::COUNTER: return "c";
        case MetricType::SET:     return "s";
        case MetricType::GAUGE:   return "g";
        case MetricType::TIMER:   return "ms";
    }
    return "c";
}

// Thrown for a type code outside {c, s, g, ms}.
class InvalidMetricType : public std::invalid_argument {
public:
    explicit InvalidMetricType(const std::string& type);

    const std::string& type() const { return type_; }

private:
    std::string type_;
};

// Parse a wire type code; throws InvalidMetricType.
MetricType parse_metric_type(const std::string& code);

class LineEncoder {
public:
    static constexpr const char* DEFAULT_PREFIX = "_t_";

    explicit LineEncoder(const std::string& hostname, std::string prefix = DEFAULT_PREFIX);

    /**
     * Encode one sample.
     * @param metric Metric name, used verbatim
     * @param value Already formatted value (deltas carry their sign)
     * @param type Wire type code, one of "c", "s", "g", "ms"
     * @param tags Dimensions, rendered in order before the hostname tag
     * @throws InvalidMetricType if type is not an allowed code
     */
    std::string encode(const std::string& metric, const std::string& value,
                       const std::string& type, const std::vector<Tag>& tags = {}) const;

    std::string encode(const std::string& metric, const std::string& value,
                       MetricType type, const std::vector<Tag>& tags = {}) const;

    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    std::string encode(const std::string& metric, T value,
                       const std::string& type, const std::vector<Tag>& tags = {}) const {
        return encode(metric, format_value(value), type, tags);
    }

    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    std::string encode(const std::string& metric, T value,
                       MetricType type, const std::vector<Tag>& tags = {}) const {
        return encode(metric, format_value(value), type, tags);
    }

    const std::string& hostname() const { return host_tag_.value(); }

private:
    std::string prefix_;
    Tag host_tag_;
};

} // namespace hoststatsd::statsd
