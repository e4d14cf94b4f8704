#include "dummy.hpp"

namespace hwtrace {

namespace {

struct empty_block_iterator : block_iterator {
    bool next(block_result& out) override {
        (void) out;
        return false;
    }
};

}

std::unique_ptr<block_iterator> dummy_trace::iter_blocks() const {
    return std::unique_ptr<block_iterator>(new empty_block_iterator());
}

size_t dummy_trace::capacity() const {
    return 0;
}

bool dummy_trace::overflowed() const {
    return false;
}

error dummy_trace::to_file(FILE* file) const {
    (void) file;
    return error();
}

dummy_thread_tracer::dummy_thread_tracer(const config& cfg):
    thread_tracer(cfg.exclusive_threads) {}

error dummy_thread_tracer::do_start() {
    return error();
}

error dummy_thread_tracer::do_stop(std::unique_ptr<trace>& out) {
    out.reset(new dummy_trace());
    return error();
}

std::unique_ptr<thread_tracer> dummy_tracer::make_thread_tracer() const {
    return std::unique_ptr<thread_tracer>(new dummy_thread_tracer(m_config));
}

} // namespace hwtrace
