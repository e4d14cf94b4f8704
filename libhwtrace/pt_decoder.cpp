#include "pt_decoder.hpp"

extern "C" {
#include "intel-pt.h"
}

#include <string.h>

#include <algorithm>
#include <iterator>
#include <iostream>
#include <sstream>

#include "cpu_utils.hpp"
#include "log.hpp"

namespace hwtrace {

namespace {

// PSB is the ext opcode pair 02 82 repeated to 16 bytes.
const uint8_t PSB_PATTERN[] = {
    0x02, 0x82, 0x02, 0x82, 0x02, 0x82, 0x02, 0x82,
    0x02, 0x82, 0x02, 0x82, 0x02, 0x82, 0x02, 0x82
};

// Serves instruction bytes of the vDSO, which libipt can't load from a file.
int read_vdso_memory(uint8_t* buffer, size_t size, const struct pt_asid* asid, uint64_t ip, void* context) {
    (void) asid;
    auto image = static_cast<const image_map*>(context);

    size_t len = image->read_vdso(ip, buffer, size);
    if (len == 0) {
        return -pte_nomap;
    }
    return static_cast<int>(len);
}

// Decides if a block ends in a control flow dispatch: 1 if it does, 0 if
// libipt gave us a partial block, -1 if the class is not one we know.
int block_is_terminated(enum pt_insn_class iclass) {
    switch (iclass) {
    case ptic_call:
    case ptic_return:
    case ptic_jump:
    case ptic_cond_jump:
    case ptic_far_call:
    case ptic_far_return:
    case ptic_far_jump:
    case ptic_indirect:
        return 1;
    case ptic_other:
    case ptic_ptwrite:
        return 0;
    default:
        return -1;
    }
}

}

size_t find_first_psb(const std::vector<uint8_t>& buf) {
    auto it = std::search(buf.begin(), buf.end(), std::begin(PSB_PATTERN), std::end(PSB_PATTERN));
    return it - buf.begin();
}

pt_block_iterator::pt_block_iterator(std::shared_ptr<const std::vector<uint8_t>> buf,
                                     std::shared_ptr<const image_map> image):
    m_buf(buf),
    m_image(image),
    m_decoder(nullptr),
    m_status(0),
    m_synced(false),
    m_step(DECODE_INIT) {}

pt_block_iterator::~pt_block_iterator() {
    if (m_decoder) {
        pt_blk_free_decoder(m_decoder);
    }
}

error pt_block_iterator::ipt_error(error_kind kind, const char* what, int status) {
    std::ostringstream detail;
    detail << what << ": " << pt_errstr(pt_errcode(status));

    uint64_t offset;
    if (m_decoder && pt_blk_get_offset(m_decoder, &offset) >= 0) {
        detail << " at offset 0x" << std::hex << offset;
    }
    return error(kind, detail.str());
}

error pt_block_iterator::init_decoder() {
    struct pt_config config;
    ::memset(&config, 0, sizeof(config));
    config.size = sizeof(config);
    config.begin = const_cast<uint8_t*>(m_buf->data());
    config.end = config.begin + m_buf->size();
    config.flags.variant.block.end_on_call = 1;
    config.flags.variant.block.end_on_jump = 1;

    // Decode for the current CPU and work around its bugs.
    cpu_id id = read_cpu_id();
    if (id.intel) {
        config.cpu.vendor = pcv_intel;
        config.cpu.family = id.family;
        config.cpu.model = id.model;
        config.cpu.stepping = id.stepping;

        int rv = pt_cpu_errata(&config.errata, &config.cpu);
        if (rv < 0) {
            return ipt_error(ERR_FATAL, "can't determine cpu errata", rv);
        }
    }

    m_decoder = pt_blk_alloc_decoder(&config);
    if (!m_decoder) {
        return error::fatal("can't allocate block decoder");
    }

    if (!m_image) {
        return error();
    }

    auto default_image = pt_blk_get_image(m_decoder);
    for (auto& segment : m_image->segments()) {
        int rv = pt_image_add_file(default_image, segment.filename.c_str(), segment.offset,
                                   segment.size, nullptr, segment.vaddr);
        if (rv < 0) {
            std::string what = "can't load " + segment.filename;
            return ipt_error(ERR_FATAL, what.c_str(), rv);
        }
    }
    if (!m_image->vdso().empty()) {
        int rv = pt_image_set_callback(default_image, read_vdso_memory, const_cast<image_map*>(m_image.get()));
        if (rv < 0) {
            return ipt_error(ERR_FATAL, "can't install vdso reader", rv);
        }
    }

    return error();
}

bool pt_block_iterator::next(block_result& out) {
    while (true) {
        switch (m_step) {
        case DECODE_INIT:
        {
            if (m_buf->empty()) {
                m_step = DECODE_DONE;
                break;
            }

            error err = init_decoder();
            if (!err.ok()) {
                m_step = DECODE_DONE;
                out = block_result(err);
                return true;
            }

            m_step = DECODE_SYNC;
            size_t skipped = find_first_psb(*m_buf);
            if (skipped != 0) {
                std::ostringstream detail;
                detail << skipped << " bytes precede the first synchronization point";
                out = block_result(error::decode(detail.str()));
                return true;
            }
            break;
        }
        case DECODE_SYNC:
        {
            int status = pt_blk_sync_forward(m_decoder);
            if (status == -pte_eos) {
                m_step = DECODE_DONE;
                break;
            }
            if (status < 0) {
                // Without a good first PSB+ there is nothing to decode. A bad
                // one further on only costs us the data up to the next PSB,
                // which libipt looks for past the one that failed.
                if (!m_synced) {
                    m_step = DECODE_DONE;
                    out = block_result(ipt_error(ERR_FATAL, "corrupt PSB+ header", status));
                } else {
                    out = block_result(ipt_error(ERR_DECODE, "can't resynchronize", status));
                }
                return true;
            }

            uint64_t sync_offset = 0;
            pt_blk_get_sync_offset(m_decoder, &sync_offset);
            HWT_DEBUG(std::cerr << "hwtrace: synchronized at offset 0x" << std::hex << sync_offset << std::dec << std::endl);

            m_synced = true;
            m_status = status;
            m_step = DECODE_BLOCKS;
            break;
        }
        case DECODE_BLOCKS:
        {
            block blk;
            error err;
            switch (fetch_block(blk, err)) {
            case FETCH_BLOCK:
                out = block_result(blk);
                return true;
            case FETCH_END:
                m_step = DECODE_DONE;
                break;
            case FETCH_RESYNC:
                m_step = DECODE_SYNC;
                out = block_result(err);
                return true;
            case FETCH_CONTINUE:
                out = block_result(err);
                return true;
            }
            break;
        }
        case DECODE_DONE:
            return false;
        }
    }
}

/*
 * Handles any pending events in the packet stream, updating the decoder
 * status as it goes.
 */
pt_block_iterator::fetch_status pt_block_iterator::handle_events(error& err) {
    while (m_status & pts_event_pending) {
        struct pt_event event;
        m_status = pt_blk_event(m_decoder, &event, sizeof(event));
        if (m_status < 0) {
            err = ipt_error(ERR_DECODE, "can't get pending event", m_status);
            return FETCH_RESYNC;
        }

        switch (event.type) {
        // Tracing enabled/disabled (TIP.PGE/TIP.PGD). Expected at the start
        // and end of a trace, and around context switches in between.
        case ptev_enabled:
        case ptev_disabled:
        case ptev_async_disabled:
        case ptev_async_branch:
        // Execution mode (MODE.Exec) and TSX transaction state (MODE.TSX).
        case ptev_exec_mode:
        case ptev_tsx:
        // Address space changes.
        case ptev_paging:
        case ptev_async_paging:
        case ptev_vmcs:
        case ptev_async_vmcs:
        // Power management: EXSTOP, MWAIT, PWRE, PWRX and core bus ratio.
        case ptev_exstop:
        case ptev_mwait:
        case ptev_pwre:
        case ptev_pwrx:
        case ptev_cbr:
        // Model-specific maintenance packet, to be ignored.
        case ptev_mnt:
            break;
        // The ring buffer filled up and packets were lost.
        case ptev_overflow:
        {
            std::ostringstream detail;
            detail << "trace data lost before ip 0x" << std::hex << event.variant.overflow.ip;
            err = error::buffer_overflow(detail.str());
            return FETCH_RESYNC;
        }
        // We didn't ask for anything else, e.g. TSC, STOP or CYC packets.
        default:
        {
            std::ostringstream detail;
            detail << "unexpected event type " << event.type;
            err = error::decode(detail.str());
            return FETCH_CONTINUE;
        }
        }
    }
    return FETCH_BLOCK;
}

/*
 * The libipt block decoder may return a partial block, for example when it
 * is interrupted by an event. We record the address of the first block we
 * see, then keep decoding until one ends in a control flow instruction.
 */
pt_block_iterator::fetch_status pt_block_iterator::fetch_block(block& out, error& err) {
    struct pt_block blk;
    ::memset(&blk, 0, sizeof(blk));

    bool first_block = true;
    uint64_t first_instr = 0;
    while (true) {
        fetch_status status = handle_events(err);
        if (status != FETCH_BLOCK) {
            return status;
        }
        if (m_status & pts_eos) {
            return FETCH_END;
        }

        m_status = pt_blk_next(m_decoder, &blk, sizeof(blk));
        if (m_status == -pte_eos) {
            return FETCH_END;
        }
        if (m_status < 0) {
            err = ipt_error(ERR_DECODE, "can't decode block", m_status);
            return FETCH_RESYNC;
        }

        // An empty block only signals that an event is pending.
        if (blk.ninsn == 0) {
            continue;
        }

        if (first_block) {
            first_instr = blk.ip;
            first_block = false;
        }

        int terminated = block_is_terminated(blk.iclass);
        if (terminated < 0) {
            std::ostringstream detail;
            detail << "unexpected instruction class " << blk.iclass << " at ip 0x" << std::hex << blk.end_ip;
            err = error::decode(detail.str());
            return FETCH_RESYNC;
        }
        if (terminated) {
            break;
        }
    }

    out = block(first_instr, blk.end_ip);
    return FETCH_BLOCK;
}

} // namespace hwtrace
