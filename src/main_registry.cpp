#include "common/config.hpp"
#include "ctrl/control_server.hpp"
#include "registry/id_registry.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace idreg {

class RegistryCore {
public:
    explicit RegistryCore(const Config& config) : config_(config) {
        setup_components();
    }

    ~RegistryCore() {
        stop();
    }

    void start() {
        spdlog::info("Starting id registry...");
        control_server_->start();
        running_ = true;
    }

    void stop() {
        if (!running_.exchange(false)) return;

        spdlog::info("Stopping id registry...");
        control_server_->stop();
        work_guard_.reset();
        io_context_.stop();
        spdlog::info("{}", registry_->dump());
    }

    void run() {
        std::vector<std::thread> io_threads;
        uint32_t thread_count = std::max<uint32_t>(1, config_.control.io_threads);
        for (uint32_t i = 0; i < thread_count; ++i) {
            io_threads.emplace_back([this]() {
                io_context_.run();
            });
        }

        {
            std::unique_lock<std::mutex> lock(shutdown_mutex_);
            shutdown_cv_.wait(lock, [this] { return shutdown_requested_.load(); });
        }

        stop();
        for (auto& thread : io_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void request_shutdown() {
        {
            std::lock_guard<std::mutex> lock(shutdown_mutex_);
            shutdown_requested_ = true;
        }
        shutdown_cv_.notify_one();
    }

private:
    void setup_components() {
        RegistryOptions options;
        options.store_path = config_.storage.enum_path();
        options.max_ids = config_.registry.max_ids;
        registry_ = std::make_shared<IdRegistry>(std::move(options));

        spdlog::info("Id store {}: {} persisted ids", config_.storage.enum_path().string(),
                     registry_->persisted_count());
        spdlog::info("{}", registry_->dump());

        control_server_ = std::make_unique<ControlServer>(
            io_context_,
            config_.control.http_port,
            config_.control.token,
            registry_
        );
    }

    Config config_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_{
        boost::asio::make_work_guard(io_context_)};

    std::shared_ptr<IdRegistry> registry_;
    std::unique_ptr<ControlServer> control_server_;

    std::atomic<bool> running_{false};
    std::mutex shutdown_mutex_;
    std::condition_variable shutdown_cv_;
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace idreg

// Global pointer for signal handler
std::unique_ptr<idreg::RegistryCore> g_core;

void signal_handler(int) {
    if (g_core) {
        g_core->request_shutdown();
    }
}

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "config.json";
        if (argc > 1) {
            config_path = argv[1];
        }

        idreg::Config config = idreg::Config::load_from_file(config_path);

        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] %v");
        spdlog::info("Loaded configuration from {}", config_path);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        g_core = std::make_unique<idreg::RegistryCore>(config);
        g_core->start();

        spdlog::info("=== Id registry is running ===");
        spdlog::info("Control HTTP port: {}", config.control.http_port);
        spdlog::info("Index root: {}", config.storage.index_root);
        spdlog::info("Press Ctrl+C to stop");

        g_core->run();
        g_core.reset();

        spdlog::info("Id registry shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
