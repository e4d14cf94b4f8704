#pragma once

namespace hwtrace {

// Keeps track of the internal state of a thread tracer.
enum tracer_state {
    TRACER_STOPPED,
    TRACER_STARTED
};

const char* tracer_state_name(tracer_state state);

} // namespace hwtrace
