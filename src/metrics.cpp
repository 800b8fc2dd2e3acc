#include "sqlmcp/metrics.hpp"
#include <sstream>

namespace sqlmcp {

namespace {

std::string escape_label(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string labels(const char* first, const std::string& a, const char* second, const std::string& b) {
    return std::string(first) + "=\"" + escape_label(a) + "\"," + second + "=\"" + escape_label(b) + "\"";
}

} // anonymous namespace

void RequestMetrics::observe_request(const std::string& method, const std::string& endpoint,
                                     std::chrono::steady_clock::duration elapsed) {
    const double seconds = std::chrono::duration<double>(elapsed).count();
    std::lock_guard<std::mutex> lock(mutex_);
    Labels key{method, endpoint};
    ++requests_[key];

    auto& h = latency_[key];
    for (size_t i = 0; i < LATENCY_BUCKETS.size(); ++i) {
        if (seconds <= LATENCY_BUCKETS[i]) ++h.buckets[i];
    }
    ++h.count;
    h.sum += seconds;
}

void RequestMetrics::observe_dispatch(const std::string& rpc_method, const std::string& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++dispatches_[Labels{rpc_method, outcome}];
}

uint64_t RequestMetrics::request_count(const std::string& method, const std::string& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(Labels{method, endpoint});
    return it == requests_.end() ? 0 : it->second;
}

uint64_t RequestMetrics::dispatch_count(const std::string& rpc_method, const std::string& outcome) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dispatches_.find(Labels{rpc_method, outcome});
    return it == dispatches_.end() ? 0 : it->second;
}

std::string RequestMetrics::render() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;

    out << "# HELP sqlmcp_request_count Count of requests received\n"
        << "# TYPE sqlmcp_request_count counter\n";
    for (const auto& [key, count] : requests_) {
        out << "sqlmcp_request_count{" << labels("method", key.first, "endpoint", key.second)
            << "} " << count << "\n";
    }

    out << "# HELP sqlmcp_request_latency_seconds Request latency in seconds\n"
        << "# TYPE sqlmcp_request_latency_seconds histogram\n";
    for (const auto& [key, h] : latency_) {
        const auto l = labels("method", key.first, "endpoint", key.second);
        for (size_t i = 0; i < LATENCY_BUCKETS.size(); ++i) {
            out << "sqlmcp_request_latency_seconds_bucket{" << l << ",le=\"" << LATENCY_BUCKETS[i]
                << "\"} " << h.buckets[i] << "\n";
        }
        out << "sqlmcp_request_latency_seconds_bucket{" << l << ",le=\"+Inf\"} " << h.count << "\n";
        out << "sqlmcp_request_latency_seconds_sum{" << l << "} " << h.sum << "\n";
        out << "sqlmcp_request_latency_seconds_count{" << l << "} " << h.count << "\n";
    }

    out << "# HELP sqlmcp_dispatch_count Count of JSON-RPC calls by outcome\n"
        << "# TYPE sqlmcp_dispatch_count counter\n";
    for (const auto& [key, count] : dispatches_) {
        out << "sqlmcp_dispatch_count{" << labels("method", key.first, "outcome", key.second)
            << "} " << count << "\n";
    }
    return out.str();
}

} // namespace sqlmcp
