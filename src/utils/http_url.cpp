#include "utils/http_url.h"

#include <regex>

namespace cqr {

std::string HttpUrl::schemeHostPort() const {
    std::string out = scheme + "://" + host;
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d{1,5}))?(/.*)?$)");
    std::smatch match;
    HttpUrl parsed;
    if (!std::regex_match(url, match, re)) {
        return parsed;
    }
    parsed.scheme = match[1].str();
    parsed.host = match[2].str();
    parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
    std::string path = match[4].matched ? match[4].str() : "";
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    parsed.path = path;
    return parsed;
}

std::string joinUrlPath(const HttpUrl& base, const std::string& path) {
    if (path.empty()) return base.path.empty() ? "/" : base.path;
    if (path.front() == '/') return base.path + path;
    return base.path + "/" + path;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (!url.valid()) {
        return nullptr;
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return nullptr;
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    auto client = std::make_unique<httplib::Client>(url.schemeHostPort());
    if (!client->is_valid()) {
        return nullptr;
    }
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    return client;
}

std::string describeHttpError(httplib::Error error) {
    return httplib::to_string(error);
}

}  // namespace cqr
