#include "receptionist/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace receptionist {

namespace {

struct CounterHelp {
    const char* name;
    const char* help;
};

const CounterHelp kCounters[] = {
    {"receptionist_calls_started_total", "Media sessions bound to a call"},
    {"receptionist_calls_completed_total", "Conversations that emitted a completion event"},
    {"receptionist_routing_decisions_total", "Inbound routing decisions by route and reason"},
    {"receptionist_tts_cache_hits_total", "Synthesis requests served from the cache"},
    {"receptionist_tts_cache_misses_total", "Synthesis requests that reached a provider"},
    {"receptionist_provider_failures_total", "Speech provider failures by capability"},
};

std::string label(const std::string& key, const std::string& value) {
    return key + "=\"" + value + "\"";
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                         0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
}

void Metrics::increment(const std::string& name, const std::string& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[{name, labels}];
}

void Metrics::increment_calls_started() {
    increment("receptionist_calls_started_total", "");
}

void Metrics::increment_calls_completed(const std::string& reason) {
    increment("receptionist_calls_completed_total", label("reason", reason));
}

void Metrics::record_routing_decision(const std::string& route, const std::string& reason) {
    increment("receptionist_routing_decisions_total",
              label("route", route) + "," + label("reason", reason));
}

void Metrics::record_tts_cache(bool hit) {
    increment(hit ? "receptionist_tts_cache_hits_total" : "receptionist_tts_cache_misses_total",
              "");
}

void Metrics::record_provider_failure(const std::string& capability,
                                      const std::string& provider) {
    increment("receptionist_provider_failures_total",
              label("capability", capability) + "," + label("provider", provider));
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& operation) {
    auto& series = latencies_[operation];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& operation, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(operation);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

uint64_t Metrics::counter_value(const std::string& name, const std::string& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find({name, labels});
    return it == counters_.end() ? 0 : it->second;
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    latencies_.clear();
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    for (const auto& counter : kCounters) {
        out << "# HELP " << counter.name << " " << counter.help << "\n";
        out << "# TYPE " << counter.name << " counter\n";
        for (const auto& item : counters_) {
            if (item.first.first != counter.name) {
                continue;
            }
            out << counter.name;
            if (!item.first.second.empty()) {
                out << "{" << item.first.second << "}";
            }
            out << " " << item.second << "\n";
        }
    }

    out << "# HELP receptionist_latency_seconds Latency of provider round trips\n";
    out << "# TYPE receptionist_latency_seconds histogram\n";
    for (const auto& item : latencies_) {
        const auto& operation = item.first;
        const auto& series = item.second;
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "receptionist_latency_seconds_bucket{operation=\"" << operation
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "receptionist_latency_seconds_bucket{operation=\"" << operation
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "receptionist_latency_seconds_count{operation=\"" << operation << "\"} "
            << series.count << "\n";
        out << "receptionist_latency_seconds_sum{operation=\"" << operation << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
