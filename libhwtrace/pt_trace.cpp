#include "pt_trace.hpp"

#include <errno.h>
#include <string.h>

#include <fstream>
#include <iterator>

#include "pt_decoder.hpp"

namespace hwtrace {

pt_trace::pt_trace(std::vector<uint8_t>&& buf, std::shared_ptr<const image_map> image, bool overflowed):
    m_buf(std::make_shared<std::vector<uint8_t>>(std::move(buf))),
    m_image(image),
    m_overflowed(overflowed) {}

std::unique_ptr<block_iterator> pt_trace::iter_blocks() const {
    return std::unique_ptr<block_iterator>(new pt_block_iterator(m_buf, m_image));
}

size_t pt_trace::capacity() const {
    return m_buf->size();
}

bool pt_trace::overflowed() const {
    return m_overflowed;
}

error pt_trace::to_file(FILE* file) const {
    size_t written = 0;
    while (written != m_buf->size()) {
        size_t wrote = ::fwrite(m_buf->data() + written, 1, m_buf->size() - written, file);
        if (wrote == 0) {
            return error::io(std::string("can't write trace: ") + ::strerror(errno));
        }
        written += wrote;
    }
    if (::fflush(file) != 0) {
        return error::io(std::string("can't flush trace: ") + ::strerror(errno));
    }
    return error();
}

error load_trace_file(const std::string& path, std::unique_ptr<trace>& out) {
    std::ifstream trace_fl(path.c_str(), std::ios::binary);
    if (!trace_fl) {
        return error::io("can't open " + path);
    }

    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(trace_fl)), std::istreambuf_iterator<char>());
    if (trace_fl.bad()) {
        return error::io("can't read " + path);
    }

    std::shared_ptr<const image_map> image;
    error err = image_map::capture_self(image);
    if (!err.ok()) {
        return err;
    }

    out.reset(new pt_trace(std::move(buf), image, false));
    return error();
}

} // namespace hwtrace
