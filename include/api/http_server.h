#pragma once

#include <httplib.h>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace cqr {

class AskEndpoints;
class NodeEndpoints;

/// Runs before routing; returning false ends the request with the response as
/// the middleware left it.
using Middleware = std::function<bool(const httplib::Request&, httplib::Response&)>;

/// Access log hook, called once per request after the response is written.
using Logger = std::function<void(const httplib::Request&, const httplib::Response&, double elapsed_seconds)>;

/// Polls until `listening` holds. Returns false as soon as `exited` holds or
/// once `timeout` has passed.
bool waitUntilListening(const std::function<bool()>& listening,
                        const std::function<bool()>& exited,
                        std::chrono::milliseconds timeout);

/// HTTP front of the router: /ask and /routes plus the operational endpoints,
/// with CORS, gzip, request ids and JSON error bodies applied to all of them.
class HttpServer {
public:
    HttpServer(int port, AskEndpoints& ask, NodeEndpoints& node, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    /// Register routes and listen on a background thread. Returns once the
    /// listener is up; throws std::runtime_error if the port cannot be bound
    /// or the listener does not come up within kStartupTimeout.
    void start();
    void stop();

    void addMiddleware(Middleware mw);
    void enableCors(bool enable) { enable_cors_ = enable; }
    void setCorsOrigin(std::string origin) { cors_allow_origin_ = std::move(origin); }
    void enableCompression(bool enable) { enable_compression_ = enable; }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    int port() const { return port_; }

    static constexpr std::chrono::milliseconds kStartupTimeout{5000};

    // Extra routes must be registered before start()
    httplib::Server& getServer() { return server_; }

private:
    void installHandlers();
    httplib::Server::HandlerResponse preRoute(const httplib::Request& req, httplib::Response& res);
    void postRoute(const httplib::Request& req, httplib::Response& res);
    void logRequest(const httplib::Request& req, const httplib::Response& res);
    void renderError(const httplib::Request& req, httplib::Response& res) const;
    void renderException(const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) const;
    void applyCors(httplib::Response& res) const;
    void compress(const httplib::Request& req, httplib::Response& res) const;

    int port_;
    std::string bind_address_;
    AskEndpoints& ask_;
    NodeEndpoints& node_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listener_exited_{false};
    std::vector<Middleware> middlewares_;
    bool enable_cors_{true};
    bool enable_compression_{true};
    std::string cors_allow_origin_{"*"};
    Logger logger_{};
};

}  // namespace cqr
