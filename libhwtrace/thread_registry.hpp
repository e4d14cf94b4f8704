#pragma once

#include <set>
#include <mutex>

#include <sys/types.h>

#include "error.hpp"

namespace hwtrace {

pid_t current_tid();

/*
 * Process-wide set of threads that currently have a started tracer.
 * Consulted by thread_tracer::start_tracing() so that two tracers never
 * arm the hardware for the same thread.
 */
class thread_registry {
public:
    static thread_registry& instance();

    error acquire(pid_t tid);
    void release(pid_t tid);
    bool contains(pid_t tid);

private:
    thread_registry() {}
    thread_registry(const thread_registry&);
    thread_registry& operator = (const thread_registry&);

    std::set<pid_t> m_threads;
    std::mutex m_mutex;
};

} // namespace hwtrace
