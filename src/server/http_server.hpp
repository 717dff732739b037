#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include "core/errors/runner_errors.hpp"
#include "server/run_code_handler.hpp"

// Forward declare httplib types to avoid including in header
namespace httplib {
class Server;
}

namespace coderunner::server {

// HTTP host for the /run_code pipeline.
class HttpServer {
public:
    HttpServer(std::shared_ptr<RunCodeHandler> handler, std::string host, int port,
               std::uint32_t worker_threads = 8);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and serves on a background thread. Port 0 picks a free port;
    // the bound port is returned.
    core::errors::Result<int> start();

    // Blocks until the serving thread exits.
    void wait();

    // Idempotent.
    void stop();

    bool is_running() const { return running_; }
    int port() const { return bound_port_; }

private:
    void register_routes();

    std::shared_ptr<RunCodeHandler> handler_;
    std::string host_;
    int port_;
    int bound_port_ = -1;
    std::uint32_t worker_threads_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace coderunner::server
