#pragma once

#include <memory>

#include <sys/types.h>

#include "config.hpp"
#include "error.hpp"
#include "trace.hpp"
#include "tracer_state.hpp"

namespace hwtrace {

/*
 * Collects a trace of the thread that calls start_tracing().
 *
 * start_tracing()/stop_tracing() own the Stopped/Started state machine and
 * only call into the backend when the transition is legal. Destroying a
 * started tracer releases its kernel resources and discards the trace.
 */
class thread_tracer {
public:
    explicit thread_tracer(bool exclusive);
    virtual ~thread_tracer();

    // Arms tracing for the calling thread. Fails with ERR_TRACER_STATE if
    // already started; the state is left untouched on any failure.
    error start_tracing();

    // Disarms tracing and hands over everything captured since the start.
    // Fails with ERR_TRACER_STATE if not started.
    error stop_tracing(std::unique_ptr<trace>& out);

    tracer_state state() const {
        return m_state;
    }

protected:
    virtual error do_start() = 0;

    // Must release every kernel resource, whether it succeeds or not.
    virtual error do_stop(std::unique_ptr<trace>& out) = 0;

private:
    thread_tracer(const thread_tracer&);
    thread_tracer& operator = (const thread_tracer&);

    tracer_state m_state;
    bool m_exclusive;
    pid_t m_tid;
};

// Hands out thread tracers for one backend.
class tracer {
public:
    virtual ~tracer() {}

    // Returns a tracer for the current thread.
    virtual std::unique_ptr<thread_tracer> make_thread_tracer() const = 0;

    virtual const char* name() const = 0;
};

// Picks the backend named by `cfg`, probing the hardware for BACKEND_AUTOMATIC.
// Debug output is switched on or off for the whole process to match cfg.debug.
error create_tracer(const config& cfg, std::unique_ptr<tracer>& out);

} // namespace hwtrace
