#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace receptionist {

class Metrics {
public:
    static Metrics& instance();

    void increment_calls_started();
    void increment_calls_completed(const std::string& reason);
    void record_routing_decision(const std::string& route, const std::string& reason);
    void record_tts_cache(bool hit);
    void record_provider_failure(const std::string& capability, const std::string& provider);
    void observe_latency(const std::string& operation, double seconds);
    std::string render_prometheus() const;

    uint64_t counter_value(const std::string& name, const std::string& labels = "") const;
    void reset();

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    using CounterKey = std::pair<std::string, std::string>;

    Metrics();

    void increment(const std::string& name, const std::string& labels);
    HistogramSeries& histogram_for(const std::string& operation);

    mutable std::mutex mutex_;
    std::map<CounterKey, uint64_t> counters_;
    std::map<std::string, HistogramSeries> latencies_;
    std::vector<double> histogram_bounds_;
};

}
