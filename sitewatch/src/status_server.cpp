#include "status_server.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

class StatusServer::Impl {
public:
    Impl(const std::string& host, int port, const std::string& service_name)
        : host_(host), port_(port), service_name_(service_name), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Status server already running");
            return;
        }

        register_routes();

        if (port_ == 0) {
            port_ = server_.bind_to_any_port(host_.c_str());
            if (port_ < 0) {
                throw std::runtime_error("Failed to bind status server on " + host_);
            }
        } else if (!server_.bind_to_port(host_.c_str(), port_)) {
            throw std::runtime_error(
                "Failed to bind status server on " + host_ + ":" + std::to_string(port_));
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            if (!server_.listen_after_bind()) {
                spdlog::error("Status server on {}:{} stopped unexpectedly", host_, port_);
            }
        });

        // stop() is a no-op until the accept loop is up
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        spdlog::info("Status server listening on {}:{}", host_, port_);
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Status server stopped");
    }

    bool is_running() const {
        return running_;
    }

    int port() const {
        return port_;
    }

    void publish(uint64_t round_id, const std::vector<StatsRecord>& snapshot) {
        nlohmann::json records = nlohmann::json::array();
        for (const auto& record : snapshot) {
            records.push_back(record.to_json());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        rounds_completed_ = round_id;
        updated_at_ = util::current_iso8601();
        stats_ = std::move(records);
    }

private:
    void register_routes() {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            health_status["service"] = service_name_;
            health_status["status"] = "healthy";
            health_status["timestamp"] = util::current_iso8601();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                health_status["rounds_completed"] = rounds_completed_;
            }
            res.status = 200;
            res.set_content(health_status.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            "application/json");
        });

        server_.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                body["rounds_completed"] = rounds_completed_;
                body["updated_at"] = updated_at_.empty() ? nlohmann::json(nullptr) : nlohmann::json(updated_at_);
                body["targets"] = stats_;
            }
            res.status = 200;
            res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            "application/json");
        });
    }

    std::string host_;
    int port_;
    std::string service_name_;
    std::atomic<bool> running_;
    httplib::Server server_;
    std::thread server_thread_;

    mutable std::mutex mutex_;
    uint64_t rounds_completed_ = 0;
    std::string updated_at_;
    nlohmann::json stats_ = nlohmann::json::array();
};

StatusServer::StatusServer(const std::string& host, int port, const std::string& service_name)
    : pImpl_(std::make_unique<Impl>(host, port, service_name)) {}

StatusServer::StatusServer(const Config& config)
    : StatusServer(config.status_host, config.status_port, config.service_name) {}

StatusServer::~StatusServer() = default;

void StatusServer::start() {
    pImpl_->start();
}

void StatusServer::stop() {
    pImpl_->stop();
}

bool StatusServer::is_running() const {
    return pImpl_->is_running();
}

int StatusServer::port() const {
    return pImpl_->port();
}

void StatusServer::publish(uint64_t round_id, const std::vector<StatsRecord>& snapshot) {
    pImpl_->publish(round_id, snapshot);
}
