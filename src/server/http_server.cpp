#include "server/http_server.hpp"

#include <chrono>
#include <utility>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace coderunner::server {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using nlohmann::json;

namespace {

constexpr const char* kJsonContentType = "application/json";

// Program output is arbitrary bytes; invalid UTF-8 is replaced rather than
// failing the whole response.
std::string to_body(const json& body) {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

HttpServer::HttpServer(std::shared_ptr<RunCodeHandler> handler, std::string host,
                       const int port, const std::uint32_t worker_threads)
    : handler_(std::move(handler)),
      host_(std::move(host)),
      port_(port),
      worker_threads_(worker_threads),
      server_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() {
    stop();
}

core::errors::Result<int> HttpServer::start() {
    if (running_) {
        CODERUNNER_LOG_WARN("HTTP server already running on port " +
                            std::to_string(bound_port_));
        return bound_port_;
    }

    register_routes();
    const std::size_t threads = worker_threads_;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    if (port_ == 0) {
        bound_port_ = server_->bind_to_any_port(host_);
    } else if (server_->bind_to_port(host_, port_)) {
        bound_port_ = port_;
    } else {
        bound_port_ = -1;
    }
    if (bound_port_ <= 0) {
        CODERUNNER_LOG_ERROR("Failed to bind HTTP server on " + host_ + ":" +
                             std::to_string(port_));
        return RunnerError{ErrorCategory::Environment,
                           "Failed to bind " + host_ + ":" + std::to_string(port_),
                           "bind_failed", "Is another process using the port?"};
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        CODERUNNER_LOG_INFO("Serving on " + host_ + ":" + std::to_string(bound_port_));
        if (!server_->listen_after_bind()) {
            CODERUNNER_LOG_ERROR("HTTP server on port " + std::to_string(bound_port_) +
                                 " stopped unexpectedly");
        }
        running_ = false;
    });

    // Give the listener a moment to come up before callers connect
    for (int i = 0; i < 200 && running_ && !server_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return bound_port_;
}

void HttpServer::wait() {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void HttpServer::stop() {
    if (!server_thread_.joinable()) {
        return;
    }

    CODERUNNER_LOG_INFO("Stopping HTTP server...");
    server_->stop();
    wait();
    running_ = false;
    CODERUNNER_LOG_INFO("HTTP server stopped");
}

void HttpServer::register_routes() {
    server_->Post("/run_code", [this](const httplib::Request& req,
                                      httplib::Response& res) {
        const HttpReply reply = handler_->handle(req.body);
        res.status = reply.status;
        res.set_content(to_body(reply.body), kJsonContentType);
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(to_body(handler_->health()), kJsonContentType);
    });
}

}  // namespace coderunner::server
