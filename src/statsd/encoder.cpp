#include "statsd/encoder.hpp"
#include <utility>

namespace hoststatsd::statsd {

InvalidMetricType::InvalidMetricType(const std::string& type)
    : std::invalid_argument("\"" + type + "\" is not a statsd metric type (one of 'c', 's', 'ms', or 'g')"),
      type_(type) {}

MetricType parse_metric_type(const std::string& code) {
    if (code == "c")  return MetricType::COUNTER;
    if (code == "s")  return MetricType::SET;
    if (code == "g")  return MetricType::GAUGE;
    if (code == "ms") return MetricType::TIMER;
    throw InvalidMetricType(code);
}

LineEncoder::LineEncoder(const std::string& hostname, std::string prefix)
    : prefix_(std::move(prefix)),
      host_tag_(make_tag("hostname", hostname)) {}

std::string LineEncoder::encode(const std::string& metric, const std::string& value,
                                const std::string& type, const std::vector<Tag>& tags) const {
    return encode(metric, value, parse_metric_type(type), tags);
}

std::string LineEncoder::encode(const std::string& metric, const std::string& value,
                                MetricType type, const std::vector<Tag>& tags) const {
    std::string line = metric;
    for (const auto& tag : tags) {
        line += '.';
        line += prefix_;
        line += tag.name();
        line += '.';
        line += tag.value();
    }
    line += '.';
    line += prefix_;
    line += host_tag_.name();
    line += '.';
    line += host_tag_.value();

    line += ':';
    line += value;
    line += '|';
    line += metric_type_code(type);
    return line;
}

} // namespace hoststatsd::statsd
