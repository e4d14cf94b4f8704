#pragma once

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <vector>

#include "image_map.hpp"
#include "trace.hpp"

struct pt_block_decoder;

namespace hwtrace {

// Offset of the first PSB packet in `buf`, or buf.size() if there is none.
size_t find_first_psb(const std::vector<uint8_t>& buf);

/*
 * Rebuilds basic blocks from raw PT packets with the libipt block decoder.
 *
 * Each iterator owns its own decoder, so several passes over one buffer may
 * run at once. Error handling:
 *  - bytes before the first PSB, errors from libipt while decoding blocks or
 *    events, overflow packets and a bad PSB+ after the first one are
 *    recoverable: one error item is yielded and decoding resumes at the next
 *    PSB;
 *  - a failure to set up the decoder or to read the first PSB+ header is
 *    fatal: one error item is yielded and the sequence ends.
 */
class pt_block_iterator : public block_iterator {
public:
    pt_block_iterator(std::shared_ptr<const std::vector<uint8_t>> buf,
                      std::shared_ptr<const image_map> image);
    ~pt_block_iterator();

    bool next(block_result& out) override;

private:
    enum decode_step {
        DECODE_INIT,
        DECODE_SYNC,
        DECODE_BLOCKS,
        DECODE_DONE
    };

    enum fetch_status {
        FETCH_BLOCK,     // A block was produced, or events were handled.
        FETCH_END,       // End of the packet stream.
        FETCH_RESYNC,    // Yield the error, then seek to the next PSB.
        FETCH_CONTINUE   // Yield the error, then carry on where we are.
    };

    error init_decoder();
    fetch_status handle_events(error& err);
    fetch_status fetch_block(block& out, error& err);
    error ipt_error(error_kind kind, const char* what, int status);

    pt_block_iterator(const pt_block_iterator&);
    pt_block_iterator& operator = (const pt_block_iterator&);

    std::shared_ptr<const std::vector<uint8_t>> m_buf;
    std::shared_ptr<const image_map> m_image;
    struct pt_block_decoder* m_decoder;
    int m_status;
    bool m_synced;      // Synchronized at least once in this pass.
    decode_step m_step;
};

} // namespace hwtrace
