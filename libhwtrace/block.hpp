#pragma once

#include <stdint.h>

namespace hwtrace {

/*
 * A reconstructed basic block, addressed by the virtual addresses of its
 * first and last instructions.
 */
struct block {
    block(): m_first_instr(0), m_last_instr(0) {}

    block(uint64_t first_instr, uint64_t last_instr):
        m_first_instr(first_instr), m_last_instr(last_instr) {}

    uint64_t first_instr() const {
        return m_first_instr;
    }

    uint64_t last_instr() const {
        return m_last_instr;
    }

private:
    uint64_t m_first_instr;
    uint64_t m_last_instr;
};

inline bool operator == (const block& b1, const block& b2) {
    return b1.first_instr() == b2.first_instr() && b1.last_instr() == b2.last_instr();
}

inline bool operator != (const block& b1, const block& b2) {
    return !(b1 == b2);
}

} // namespace hwtrace
