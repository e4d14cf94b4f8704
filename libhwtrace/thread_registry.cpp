#include "thread_registry.hpp"

#include <sys/syscall.h>
#include <unistd.h>

namespace hwtrace {

typedef std::unique_lock<std::mutex> locker_t;

pid_t current_tid() {
    return ::syscall(SYS_gettid);
}

thread_registry& thread_registry::instance() {
    static thread_registry registry;
    return registry;
}

error thread_registry::acquire(pid_t tid) {
    locker_t _l(m_mutex);
    if (!m_threads.insert(tid).second) {
        return error::thread_already_traced(tid);
    }
    return error();
}

void thread_registry::release(pid_t tid) {
    locker_t _l(m_mutex);
    m_threads.erase(tid);
}

bool thread_registry::contains(pid_t tid) {
    locker_t _l(m_mutex);
    return m_threads.count(tid) != 0;
}

} // namespace hwtrace
