#pragma once

namespace hwtrace {

bool debug_enabled();
void set_debug_enabled(bool enabled);

} // namespace hwtrace

// Runs a logging statement only when debug output is on, e.g.
// HWT_DEBUG(std::cerr << "hwtrace: opened fd " << fd << std::endl);
#define HWT_DEBUG(x) do { if (::hwtrace::debug_enabled()) { x; } } while (0)
