#pragma once
#include <string>
#include <type_traits>

namespace hoststatsd::statsd {

// Format a numeric metric or tag value. Integral values print without a
// decimal point, everything else in shortest round-trip form.
std::string format_number(double value);

template <typename T>
std::enable_if_t<std::is_arithmetic_v<T>, std::string> format_value(T value) {
    if constexpr (std::is_integral_v<T>) {
        return std::to_string(value);
    } else {
        return format_number(static_cast<double>(value));
    }
}

// Replace characters that separate tags, fields or records on the wire with '-'.
std::string sanitize(const std::string& input);

// A dimension attached to a sample. Both fields are sanitized on construction.
class Tag {
public:
    Tag(const std::string& name, const std::string& value);

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }

private:
    std::string name_;
    std::string value_;
};

Tag make_tag(const std::string& name, const std::string& value);

inline Tag make_tag(const std::string& name, const char* value) {
    return make_tag(name, std::string(value));
}

template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
Tag make_tag(const std::string& name, T value) {
    return make_tag(name, format_value(value));
}

} // namespace hoststatsd::statsd
