#include "runtime/state.h"

namespace cqr {

std::atomic<bool> g_running_flag{true};
std::atomic<bool> g_ready_flag{false};
std::atomic<unsigned int> g_active_asks{0};
std::atomic<uint64_t> g_total_asks{0};

}  // namespace cqr
