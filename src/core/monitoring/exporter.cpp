#include "mathtune/monitoring/exporter.h"

#include <chrono>
#include <exception>

#include "mathtune/monitoring/metric_registry.h"

namespace mathtune {

MetricsExporter::~MetricsExporter() {
    Stop();
}

bool MetricsExporter::Start(const std::string& bind_address, int port, std::string* error) {
    if (running_.load()) {
        return true;
    }
    if (port <= 0 || port > 65535) {
        if (error != nullptr) {
            *error = "metrics port out of range: " + std::to_string(port);
        }
        return false;
    }
#if !MATHTUNE_WITH_METRICS
    (void)bind_address;
    if (error != nullptr) {
        *error = "metrics support requires MATHTUNE_WITH_METRICS=ON";
    }
    return false;
#else
    stop_requested_.store(false);
    running_.store(false);
    start_error_.clear();

    const std::string endpoint = bind_address + ":" + std::to_string(port);
    worker_ = std::thread([this, endpoint]() {
        try {
            auto exposer = std::make_unique<prometheus::Exposer>(endpoint);
            exposer->RegisterCollectable(MetricRegistry::Instance().GetPrometheusRegistry());
            exposer_ = std::move(exposer);
            running_.store(true);
            while (!stop_requested_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            exposer_.reset();
            running_.store(false);
        } catch (const std::exception& ex) {
            // Read by Start() only after join.
            start_error_ = ex.what();
            running_.store(false);
        }
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (running_.load()) {
            if (error != nullptr) {
                error->clear();
            }
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    stop_requested_.store(true);
    if (worker_.joinable()) {
        worker_.join();
    }
    if (error != nullptr) {
        *error = "metrics exporter failed to start on " + endpoint;
        if (!start_error_.empty()) {
            *error += ": " + start_error_;
        }
    }
    return false;
#endif
}

void MetricsExporter::Stop() {
    stop_requested_.store(true);
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);
}

bool MetricsExporter::IsRunning() const {
    return running_.load();
}

}  // namespace mathtune
