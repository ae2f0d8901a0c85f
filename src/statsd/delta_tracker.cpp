#include "statsd/delta_tracker.hpp"
#include "statsd/tag.hpp"
#include <cmath>

namespace hoststatsd::statsd {

std::string DeltaTracker::signed_delta(double previous, double current) {
    // Rounded readings subtract with float noise; keep 6 decimals
    double delta = std::round((current - previous) * 1e6) / 1e6;
    if (delta >= 0) {
        return "+" + format_number(delta);
    }
    return format_number(delta);
}

std::string DeltaTracker::track(const std::string& key, double current) {
    auto it = last_.find(key);
    if (it == last_.end()) {
        last_.emplace(key, current);
        return format_number(current);
    }

    std::string value = signed_delta(it->second, current);
    it->second = current;
    return value;
}

std::string DeltaTracker::track_from_zero(const std::string& key, double current) {
    auto it = last_.find(key);
    double previous = (it == last_.end()) ? 0.0 : it->second;
    last_[key] = current;
    return signed_delta(previous, current);
}

bool DeltaTracker::contains(const std::string& key) const {
    return last_.count(key) > 0;
}

void DeltaTracker::reset() {
    last_.clear();
}

} // namespace hoststatsd::statsd
