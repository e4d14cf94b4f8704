#pragma once

#include <stddef.h>
#include <stdio.h>

#include <memory>
#include <string>

#include "block.hpp"
#include "error.hpp"

namespace hwtrace {

// One item of a block sequence: either a block or an error.
struct block_result {
    block_result() {}
    explicit block_result(const block& b): m_block(b) {}
    explicit block_result(const error& e): m_error(e) {}

    bool ok() const {
        return m_error.ok();
    }

    const block& value() const {
        return m_block;
    }

    const error& err() const {
        return m_error;
    }

private:
    block m_block;
    error m_error;
};

/*
 * A lazy, single-pass producer of blocks.
 *
 * An error item does not end the sequence by itself: recoverable errors are
 * followed by more items, terminal ones are the last item. Always keep
 * calling next() until it returns false.
 */
class block_iterator {
public:
    virtual ~block_iterator() {}

    // Fills `out` with the next item. Returns false once the sequence is over.
    virtual bool next(block_result& out) = 0;
};

/*
 * A captured trace. Immutable once produced by thread_tracer::stop_tracing()
 * and independent of the tracer that made it, so it may be moved to and
 * decoded on any thread.
 */
class trace {
public:
    virtual ~trace() {}

    // Starts a fresh decode pass from the beginning of the trace.
    virtual std::unique_ptr<block_iterator> iter_blocks() const = 0;

    // Size of the captured buffer in bytes.
    virtual size_t capacity() const = 0;

    // The kernel reported lost data while this trace was collected.
    virtual bool overflowed() const = 0;

    // Writes the raw captured bytes, unframed, to `file`.
    virtual error to_file(FILE* file) const = 0;
};

// Reads a raw perf_pt dump written by trace::to_file(). The trace is decoded
// against the code of the current process.
error load_trace_file(const std::string& path, std::unique_ptr<trace>& out);

} // namespace hwtrace
