#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace observability {

// Label values of one series, in the family's label-name order.
using LabelValues = std::vector<std::string>;

struct LabelValuesHash {
    size_t operator()(LabelValues const& v) const noexcept {
        size_t seed = 0;
        for (const auto& s : v) seed ^= std::hash<std::string>()(s) + 0x9e3779b97f4a7c15ULL + (seed<<6) + (seed>>2);
        return seed;
    }
};

// Cumulative-bucket histogram in milliseconds.
struct Histogram {
    std::vector<uint64_t> buckets;
    double sum = 0.0;
    uint64_t count = 0;

    void observe(double ms, const std::vector<double>& bounds);
};

// Outcome label for upstream_requests_total.
enum class UpstreamOutcome { Ok, HttpError, Unavailable };

const char* to_string(UpstreamOutcome outcome);

class Metrics {
public:
    static Metrics& instance();

    // path is the route pattern, never the raw target
    void inc(const std::string& path, const std::string& method, int code);
    void observe_latency(const std::string& path, const std::string& method, double latency_ms);

    // route is "METHOD pattern" of the inbound route that made the call
    void inc_upstream(const std::string& route, UpstreamOutcome outcome);
    void observe_upstream_latency(const std::string& route, double latency_ms);

    // Prometheus text exposition, version 0.0.4.
    std::string scrape() const;

private:
    Metrics();

    struct Family {
        std::string name;
        std::string help;
        std::vector<std::string> label_names;
        std::unordered_map<LabelValues, uint64_t, LabelValuesHash> counters;
        std::unordered_map<LabelValues, Histogram, LabelValuesHash> histograms;
    };

    Family http_requests_;
    Family http_latency_;
    Family upstream_requests_;
    Family upstream_latency_;
    mutable std::mutex mu_;
};

}
