#include "log.hpp"

#include <stdlib.h>
#include <string.h>

#include <atomic>

namespace hwtrace {

namespace {

enum debug_flag {
    DEBUG_UNSET,
    DEBUG_OFF,
    DEBUG_ON
};

std::atomic<int> g_debug_flag(DEBUG_UNSET);

}

bool debug_enabled() {
    int flag = g_debug_flag.load();
    if (flag == DEBUG_UNSET) {
        auto debug_str = std::getenv("HWTRACE_DEBUG");
        flag = (debug_str && ::strcmp(debug_str, "0") != 0) ? DEBUG_ON : DEBUG_OFF;

        int expected = DEBUG_UNSET;
        // A concurrent set_debug_enabled() wins over the environment.
        if (!g_debug_flag.compare_exchange_strong(expected, flag)) {
            flag = expected;
        }
    }
    return flag == DEBUG_ON;
}

void set_debug_enabled(bool enabled) {
    g_debug_flag.store(enabled ? DEBUG_ON : DEBUG_OFF);
}

} // namespace hwtrace
