// http_url.h - base URL parsing and httplib client construction
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <httplib.h>

namespace cqr {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;  // "" or "/prefix" without trailing slash

    bool valid() const { return !scheme.empty() && !host.empty(); }
    std::string schemeHostPort() const;
};

// Parse "scheme://host[:port][/path]". Returns an invalid HttpUrl on failure.
HttpUrl parseUrl(const std::string& url);

// Append a path to the base path, avoiding duplicate slashes.
std::string joinUrlPath(const HttpUrl& base, const std::string& path);

// Client with identical connection/read/write timeouts. nullptr when the URL
// is invalid or its scheme is unsupported by this build.
std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout);

// Human-readable description of a failed httplib result.
std::string describeHttpError(httplib::Error error);

}  // namespace cqr
