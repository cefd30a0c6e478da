#pragma once

#include "config/config_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace apidocs {

class ExplorerHandler;

/**
 * @brief Standalone HTTP server hosting one API explorer
 *
 * Mounts the explorer at a fixed prefix and adds a JSON health endpoint.
 * start() blocks until stop() is called from another thread or a signal.
 * A port of 0 binds an ephemeral port, reported by port() once bound.
 */
class ExplorerServer {
public:
    ExplorerServer(
        std::shared_ptr<ExplorerHandler> explorer,
        ServerConfig config = {},
        std::string mount_point = "/swagger/");

    ~ExplorerServer();

    ExplorerServer(const ExplorerServer&) = delete;
    ExplorerServer& operator=(const ExplorerServer&) = delete;

    /// @throws std::runtime_error if the listener cannot bind
    void start();

    /// Stops the listener; a stop() that precedes start() makes start() return at once.
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Bound port; 0 until start() has bound the socket.
    [[nodiscard]] int port() const { return bound_port_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& mount_point() const { return mount_point_; }

private:
    void register_routes(httplib::Server& svr);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<ExplorerHandler> explorer_;
    const ServerConfig config_;
    const std::string mount_point_;

    mutable std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> stopping_{false};
    std::atomic<int> bound_port_{0};
};

} // namespace apidocs
