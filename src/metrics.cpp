#include "voice_relay/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_relay {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {1.0, 5.0, 15.0, 30.0, 60.0, 120.0, 300.0, 600.0, 1800.0, 3600.0};
    session_durations_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::increment(const std::string& counter, uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counter] += value;
}

void Metrics::session_opened() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[metric::kSessionsStarted];
    ++active_sessions_;
}

void Metrics::session_closed(double duration_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_sessions_;
    auto& histogram = session_durations_;
    histogram.count += 1;
    histogram.sum += duration_seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (duration_seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

uint64_t Metrics::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

int64_t Metrics::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_sessions_;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    for (const auto& item : counters_) {
        out << "# TYPE " << item.first << " counter\n";
        out << item.first << " " << item.second << "\n";
    }

    out << "# HELP relay_sessions_active Calls currently being relayed\n";
    out << "# TYPE relay_sessions_active gauge\n";
    out << "relay_sessions_active " << active_sessions_ << "\n";

    out << "# HELP relay_session_duration_seconds Duration of finished calls\n";
    out << "# TYPE relay_session_duration_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "relay_session_duration_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << session_durations_.buckets[i] << "\n";
    }
    out << "relay_session_duration_seconds_bucket{le=\"+Inf\"} "
        << session_durations_.buckets.back() << "\n";
    out << "relay_session_duration_seconds_count " << session_durations_.count << "\n";
    out << "relay_session_duration_seconds_sum " << session_durations_.sum << "\n";

    return out.str();
}

}
