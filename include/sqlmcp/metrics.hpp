#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace sqlmcp {

/// Request counters and latency histograms, rendered in the Prometheus
/// text exposition format.
class RequestMetrics {
public:
    static constexpr std::array<double, 11> LATENCY_BUCKETS{
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
    };

    /// One HTTP request on an endpoint.
    void observe_request(const std::string& method, const std::string& endpoint,
                         std::chrono::steady_clock::duration elapsed);

    /// One dispatched JSON-RPC call. outcome is "ok" or the error code.
    void observe_dispatch(const std::string& rpc_method, const std::string& outcome);

    [[nodiscard]] uint64_t request_count(const std::string& method, const std::string& endpoint) const;
    [[nodiscard]] uint64_t dispatch_count(const std::string& rpc_method, const std::string& outcome) const;

    [[nodiscard]] std::string render() const;

private:
    using Labels = std::pair<std::string, std::string>;

    struct Histogram {
        std::array<uint64_t, LATENCY_BUCKETS.size()> buckets{};
        uint64_t count = 0;
        double sum = 0.0;
    };

    mutable std::mutex mutex_;
    std::map<Labels, uint64_t> requests_;
    std::map<Labels, Histogram> latency_;
    std::map<Labels, uint64_t> dispatches_;
};

} // namespace sqlmcp
