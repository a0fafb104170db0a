#pragma once

#include <atomic>
#include <cstdint>

namespace cqr {

extern std::atomic<bool> g_running_flag;
extern std::atomic<bool> g_ready_flag;
extern std::atomic<unsigned int> g_active_asks;
extern std::atomic<uint64_t> g_total_asks;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }
inline bool is_ready() { return g_ready_flag.load(); }
inline void set_ready(bool v) { g_ready_flag.store(v); }

inline unsigned int active_ask_count() { return g_active_asks.load(); }
inline uint64_t total_ask_count() { return g_total_asks.load(); }

/// Counts an in-flight /ask request for its lifetime. Asks are not limited;
/// the counters only feed /metrics.
class AskGuard {
public:
    AskGuard() {
        g_active_asks.fetch_add(1);
        g_total_asks.fetch_add(1);
    }
    ~AskGuard() { g_active_asks.fetch_sub(1); }

    AskGuard(const AskGuard&) = delete;
    AskGuard& operator=(const AskGuard&) = delete;
};

}  // namespace cqr
