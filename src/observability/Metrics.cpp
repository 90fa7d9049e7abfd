#include "Metrics.h"
#include <sstream>

namespace observability {

static const std::vector<double>& latency_buckets() {
    static const std::vector<double> buckets = {1,2,5,10,20,50,100,200,500,1000,2000,5000,10000,30000};
    return buckets;
}

const char* to_string(UpstreamOutcome outcome) {
    switch (outcome) {
        case UpstreamOutcome::Ok: return "ok";
        case UpstreamOutcome::HttpError: return "http_error";
        case UpstreamOutcome::Unavailable: return "unavailable";
    }
    return "unknown";
}

void Histogram::observe(double ms, const std::vector<double>& bounds) {
    if (buckets.empty()) buckets.assign(bounds.size(), 0);
    count += 1;
    sum += ms;
    for (size_t i = 0; i < bounds.size(); ++i) { if (ms <= bounds[i]) buckets[i] += 1; }
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {
    http_requests_ = {"http_requests_total", "Total HTTP requests", {"path", "method", "code"}, {}, {}};
    http_latency_ = {"http_request_duration_ms", "Histogram of request durations", {"path", "method"}, {}, {}};
    upstream_requests_ = {"upstream_requests_total", "Upstream calls by route and outcome", {"route", "outcome"}, {}, {}};
    upstream_latency_ = {"upstream_request_duration_ms", "Histogram of upstream call durations", {"route"}, {}, {}};
}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    LabelValues v{path, method, std::to_string(code)};
    std::lock_guard lock(mu_);
    http_requests_.counters[v] += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    LabelValues v{path, method};
    std::lock_guard lock(mu_);
    http_latency_.histograms[v].observe(latency_ms, latency_buckets());
}

void Metrics::inc_upstream(const std::string& route, UpstreamOutcome outcome) {
    LabelValues v{route, to_string(outcome)};
    std::lock_guard lock(mu_);
    upstream_requests_.counters[v] += 1;
}

void Metrics::observe_upstream_latency(const std::string& route, double latency_ms) {
    LabelValues v{route};
    std::lock_guard lock(mu_);
    upstream_latency_.histograms[v].observe(latency_ms, latency_buckets());
}

// name{a="x",b="y"[,le="..."]}
static void write_series(std::ostringstream& ss, const std::string& name, const std::vector<std::string>& names,
                         const LabelValues& values, const char* le = nullptr) {
    ss << name << '{';
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) ss << ',';
        ss << names[i] << "=\"" << values[i] << '"';
    }
    if (le) ss << (names.empty() ? "" : ",") << "le=\"" << le << '"';
    ss << '}';
}

static void write_counters(std::ostringstream& ss, const std::string& name, const std::string& help,
                           const std::vector<std::string>& names,
                           const std::unordered_map<LabelValues, uint64_t, LabelValuesHash>& series) {
    ss << "# HELP " << name << ' ' << help << "\n";
    ss << "# TYPE " << name << " counter\n";
    for (const auto& p : series) {
        write_series(ss, name, names, p.first);
        ss << ' ' << p.second << "\n";
    }
}

static void write_histograms(std::ostringstream& ss, const std::string& name, const std::string& help,
                             const std::vector<std::string>& names,
                             const std::unordered_map<LabelValues, Histogram, LabelValuesHash>& series) {
    const auto& bounds = latency_buckets();
    ss << "# HELP " << name << ' ' << help << "\n";
    ss << "# TYPE " << name << " histogram\n";
    for (const auto& p : series) {
        const auto& h = p.second;
        for (size_t i = 0; i < bounds.size(); ++i) {
            std::ostringstream le; le << bounds[i];
            write_series(ss, name + "_bucket", names, p.first, le.str().c_str());
            ss << ' ' << h.buckets[i] << "\n";
        }
        write_series(ss, name + "_bucket", names, p.first, "+Inf");
        ss << ' ' << h.count << "\n";
        write_series(ss, name + "_sum", names, p.first);
        ss << ' ' << h.sum << "\n";
        write_series(ss, name + "_count", names, p.first);
        ss << ' ' << h.count << "\n";
    }
}

std::string Metrics::scrape() const {
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    write_counters(ss, http_requests_.name, http_requests_.help, http_requests_.label_names, http_requests_.counters);
    write_histograms(ss, http_latency_.name, http_latency_.help, http_latency_.label_names, http_latency_.histograms);
    write_counters(ss, upstream_requests_.name, upstream_requests_.help, upstream_requests_.label_names, upstream_requests_.counters);
    write_histograms(ss, upstream_latency_.name, upstream_latency_.help, upstream_latency_.label_names, upstream_latency_.histograms);
    return ss.str();
}

}
