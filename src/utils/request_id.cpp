#include "utils/request_id.h"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace cqr {

namespace {

std::string random_hex(int words) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < words; ++i) {
        oss << std::setw(16) << rng();
    }
    return oss.str();
}

bool is_hex(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isxdigit(c)) return false;
    }
    return !s.empty();
}

}  // namespace

std::string generate_request_id() {
    return random_hex(1);
}

std::string next_traceparent(const std::string& incoming) {
    std::string trace_id;
    if (incoming.size() >= 55 && incoming.compare(0, 3, "00-") == 0) {
        std::string candidate = incoming.substr(3, 32);
        if (is_hex(candidate)) trace_id = candidate;
    }
    if (trace_id.empty()) trace_id = random_hex(2);
    return "00-" + trace_id + "-" + random_hex(1) + "-01";
}

}  // namespace cqr
