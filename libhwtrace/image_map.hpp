#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "error.hpp"

namespace hwtrace {

// An executable PT_LOAD segment backed by a file on disk.
struct image_segment {
    std::string filename;
    uint64_t offset;
    uint64_t size;
    uint64_t vaddr;
};

/*
 * The code of a process at the moment a trace was stopped: where each
 * executable segment lives on disk, plus a private copy of the vDSO, which
 * has no backing file.
 */
class image_map {
public:
    image_map(): m_vdso_vaddr(0) {}

    // Snapshots the loaded objects of the current process.
    static error capture_self(std::shared_ptr<const image_map>& out);

    void add_segment(const image_segment& segment) {
        m_segments.push_back(segment);
    }

    void set_vdso(uint64_t vaddr, const uint8_t* code, size_t len);

    const std::vector<image_segment>& segments() const {
        return m_segments;
    }

    uint64_t vdso_vaddr() const {
        return m_vdso_vaddr;
    }

    const std::vector<uint8_t>& vdso() const {
        return m_vdso;
    }

    // Copies up to `size` bytes at `vaddr` out of the vDSO copy. Returns the
    // number of bytes copied, 0 when `vaddr` is outside the vDSO.
    size_t read_vdso(uint64_t vaddr, uint8_t* buffer, size_t size) const;

private:
    std::vector<image_segment> m_segments;
    uint64_t m_vdso_vaddr;
    std::vector<uint8_t> m_vdso;
};

} // namespace hwtrace
