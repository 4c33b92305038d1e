#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#if MATHTUNE_WITH_METRICS
#include <prometheus/exposer.h>
#endif

namespace mathtune {

// Serves MetricRegistry::Instance() over HTTP from a background thread.
class MetricsExporter {
   public:
    MetricsExporter() = default;
    ~MetricsExporter();

    bool Start(const std::string& bind_address, int port, std::string* error);
    void Stop();
    bool IsRunning() const;

   private:
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::string start_error_;
    std::thread worker_;

#if MATHTUNE_WITH_METRICS
    std::unique_ptr<prometheus::Exposer> exposer_;
#endif
};

}  // namespace mathtune
