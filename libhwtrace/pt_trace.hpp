#pragma once

#include <stdint.h>

#include <memory>
#include <vector>

#include "image_map.hpp"
#include "trace.hpp"

namespace hwtrace {

/*
 * Raw Intel PT packets plus the image needed to follow them.
 *
 * The buffer is shared read-only with every iterator handed out, so an
 * iterator stays valid even if the trace is dropped first.
 */
class pt_trace : public trace {
public:
    pt_trace(std::vector<uint8_t>&& buf, std::shared_ptr<const image_map> image, bool overflowed);

    std::unique_ptr<block_iterator> iter_blocks() const override;
    size_t capacity() const override;
    bool overflowed() const override;
    error to_file(FILE* file) const override;

    const std::vector<uint8_t>& bytes() const {
        return *m_buf;
    }

private:
    std::shared_ptr<const std::vector<uint8_t>> m_buf;
    std::shared_ptr<const image_map> m_image;
    bool m_overflowed;
};

} // namespace hwtrace
