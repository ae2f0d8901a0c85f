#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

namespace hoststatsd::statsd {

/**
 * Per-key delta reporting for gauges.
 *
 * The first observation of a key reports the absolute value; later ones
 * report the change since the previous observation, with an explicit '+'
 * when the change is non-negative. reset() forgets every key so the next
 * report is absolute again.
 *
 * Not thread-safe; owned by the scheduler thread.
 */
class DeltaTracker {
public:
    // Absolute on first observation, signed delta afterwards.
    std::string track(const std::string& key, double current);

    // Like track(), but the first observation is measured against 0.
    std::string track_from_zero(const std::string& key, double current);

    bool contains(const std::string& key) const;
    size_t size() const { return last_.size(); }

    void reset();

private:
    static std::string signed_delta(double previous, double current);

    std::unordered_map<std::string, double> last_;
};

} // namespace hoststatsd::statsd
