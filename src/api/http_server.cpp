#include "api/http_server.h"

#include "api/ask_endpoints.h"
#include "api/node_endpoints.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <zlib.h>
#include "utils/request_id.h"

namespace cqr {

namespace {

constexpr const char* kCorsMethods = "GET, POST, OPTIONS";
constexpr const char* kCorsHeaders = "Content-Type, Authorization, X-Request-Id, traceparent";
// Bodies below this size are sent as is.
constexpr size_t kMinGzipBytes = 256;

// httplib runs pre-routing, the handler and the logger for a request on the
// same worker thread.
thread_local std::chrono::steady_clock::time_point t_request_start;

bool acceptsGzip(const httplib::Request& req) {
    std::string enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

// gzip member (windowBits 15 + 16) in one deflate call. Empty on failure.
std::string gzipCompress(const std::string& input) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }
    std::string output(deflateBound(&zs, static_cast<uLong>(input.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = reinterpret_cast<Bytef*>(&output[0]);
    zs.avail_out = static_cast<uInt>(output.size());

    const int ret = deflate(&zs, Z_FINISH);
    const size_t written = zs.total_out;
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        return {};
    }
    output.resize(written);
    return output;
}

nlohmann::json errorBody(const std::string& code, const std::string& type, const std::string& message,
                         const httplib::Request& req) {
    return {{"error", {{"code", code}, {"type", type}, {"message", message}, {"path", req.path}}}};
}

}  // namespace

bool waitUntilListening(const std::function<bool()>& listening,
                        const std::function<bool()>& exited,
                        std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!listening()) {
        if (exited() || std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

HttpServer::HttpServer(int port, AskEndpoints& ask, NodeEndpoints& node, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), ask_(ask), node_(node) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::addMiddleware(Middleware mw) {
    middlewares_.push_back(std::move(mw));
}

void HttpServer::applyCors(httplib::Response& res) const {
    if (!enable_cors_) return;
    if (!res.has_header("Access-Control-Allow-Origin"))
        res.set_header("Access-Control-Allow-Origin", cors_allow_origin_);
    if (!res.has_header("Access-Control-Allow-Methods"))
        res.set_header("Access-Control-Allow-Methods", kCorsMethods);
    if (!res.has_header("Access-Control-Allow-Headers"))
        res.set_header("Access-Control-Allow-Headers", kCorsHeaders);
}

httplib::Server::HandlerResponse HttpServer::preRoute(const httplib::Request& req, httplib::Response& res) {
    t_request_start = std::chrono::steady_clock::now();

    std::string request_id = req.get_header_value("X-Request-Id");
    if (request_id.empty()) request_id = generate_request_id();
    res.set_header("X-Request-Id", request_id);
    res.set_header("traceparent", next_traceparent(req.get_header_value("traceparent")));

    // Middlewares and preflight can end the request before post-routing runs.
    applyCors(res);
    if (enable_cors_ && req.method == "OPTIONS") {
        res.status = 204;
        return httplib::Server::HandlerResponse::Handled;
    }

    for (auto& mw : middlewares_) {
        if (!mw(req, res)) return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
}

void HttpServer::compress(const httplib::Request& req, httplib::Response& res) const {
    if (res.body.size() < kMinGzipBytes || res.has_header("Content-Encoding") || !acceptsGzip(req)) {
        return;
    }
    std::string compressed = gzipCompress(res.body);
    if (compressed.empty()) return;

    std::string content_type = res.get_header_value("Content-Type");
    if (content_type.empty()) content_type = "application/octet-stream";
    res.set_content(std::move(compressed), content_type);
    res.set_header("Content-Encoding", "gzip");
    res.set_header("Vary", "Accept-Encoding");
}

void HttpServer::postRoute(const httplib::Request& req, httplib::Response& res) {
    applyCors(res);
    if (enable_compression_) {
        compress(req, res);
    }
}

void HttpServer::logRequest(const httplib::Request& req, const httplib::Response& res) {
    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - t_request_start).count();
    node_.recordHttpRequest(req, res, elapsed);
    if (logger_) {
        logger_(req, res, elapsed);
    }
}

void HttpServer::renderError(const httplib::Request& req, httplib::Response& res) const {
    // Handlers and middlewares that wrote a body keep it.
    if (!res.body.empty()) return;

    nlohmann::json body;
    if (res.status == 404) {
        body = errorBody("not_found", "invalid_request_error", "no route for " + req.method + " " + req.path, req);
    } else if (res.status == 405) {
        body = errorBody("method_not_allowed", "invalid_request_error", req.method + " is not allowed here", req);
    } else {
        body = errorBody("http_error", res.status >= 500 ? "internal_error" : "invalid_request_error",
                         "HTTP " + std::to_string(res.status), req);
    }
    res.set_content(body.dump(), "application/json");
}

void HttpServer::renderException(const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) const {
    std::string what = "unknown error";
    try {
        if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        what = e.what();
    } catch (...) {
        what = "non-standard exception";
    }
    spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, what);
    res.status = 500;
    res.set_content(errorBody("internal_error", "internal_error", what, req).dump(), "application/json");
}

void HttpServer::installHandlers() {
    server_.set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) { return preRoute(req, res); });
    server_.set_post_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) { postRoute(req, res); });
    server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) { logRequest(req, res); });
    server_.set_error_handler(
        [this](const httplib::Request& req, httplib::Response& res) { renderError(req, res); });
    server_.set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        renderException(req, res, ep);
    });
}

void HttpServer::start() {
    if (running_) return;

    installHandlers();
    ask_.registerRoutes(server_);
    node_.registerRoutes(server_);

    if (!server_.bind_to_port(bind_address_, port_)) {
        throw std::runtime_error("failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }
    listener_exited_ = false;
    thread_ = std::thread([this]() {
        if (!server_.listen_after_bind()) {
            spdlog::error("HTTP listener on {}:{} stopped with an error", bind_address_, port_);
        }
        listener_exited_ = true;
    });

    const bool listening = waitUntilListening([this]() { return server_.is_running(); },
                                              [this]() { return listener_exited_.load(); },
                                              kStartupTimeout);
    if (!listening) {
        // A listener that has not started yet only honours stop() once it runs.
        while (!listener_exited_) {
            server_.stop();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        thread_.join();
        throw std::runtime_error("failed to listen on " + bind_address_ + ":" + std::to_string(port_));
    }
    running_ = true;
    spdlog::info("HTTP server listening on {}:{}", bind_address_, port_);
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace cqr
