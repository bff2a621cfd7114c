#include "protocol/frame.hpp"
#include "protocol/byte_codec.hpp"
#include "protocol/response_codec.hpp"
#include "core/config.hpp"

#include <cerrno>
#include <unistd.h>

namespace billwire {

bool write_all(int fd, const void* data, size_t n) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t remaining = n;
    while (remaining > 0) {
        ssize_t w = ::write(fd, p, remaining);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (w == 0) return false;
        p += w;
        remaining -= static_cast<size_t>(w);
    }
    return true;
}

// Reads until n bytes arrive or the stream stops; returns the count read.
static size_t read_up_to(int fd, uint8_t* p, size_t n,
                         const ReadWaitFn& keep_waiting = {}) {
    size_t got = 0;
    while (got < n) {
        ssize_t r = ::read(fd, p + got, n - got);
        if (r < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (keep_waiting && keep_waiting()) continue;
                break;
            }
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) break; // EOF
        got += static_cast<size_t>(r);
    }
    return got;
}

bool read_all(int fd, void* data, size_t n) {
    return read_up_to(fd, static_cast<uint8_t*>(data), n) == n;
}

bool write_message(int fd, const std::vector<uint8_t>& message) {
    if (message.empty()) return true;
    return write_all(fd, message.data(), message.size());
}

static ProtocolError read_header(int fd, std::vector<uint8_t>& message,
                                 const ReadWaitFn& keep_waiting) {
    message.assign(HEADER_SIZE, 0);
    size_t got = read_up_to(fd, message.data(), HEADER_SIZE, keep_waiting);
    if (got < HEADER_SIZE) {
        message.resize(got);
        return ProtocolError::kTruncatedHeader;
    }
    return ProtocolError::kNone;
}

static ProtocolError read_body(int fd, size_t tml, std::vector<uint8_t>& message,
                               const ReadWaitFn& keep_waiting) {
    message.resize(tml);
    size_t want = tml - HEADER_SIZE;
    if (read_up_to(fd, message.data() + HEADER_SIZE, want, keep_waiting) < want) {
        message.resize(HEADER_SIZE);
        return ProtocolError::kTruncatedBody;
    }
    return ProtocolError::kNone;
}

ProtocolError read_request_message(int fd, std::vector<uint8_t>& message,
                                   const ReadWaitFn& keep_waiting) {
    ProtocolError err = read_header(fd, message, keep_waiting);
    if (err != ProtocolError::kNone) return err;

    size_t tml = load_u16(message.data() + 2);
    if (tml < MIN_REQUEST_LENGTH) return ProtocolError::kInvalidLength;

    return read_body(fd, tml, message, keep_waiting);
}

ProtocolError read_response_message(int fd, std::vector<uint8_t>& message) {
    ProtocolError err = read_header(fd, message, {});
    if (err != ProtocolError::kNone) return err;

    // ReqNum FFFF: nothing follows
    if (is_error_response(message.data(), message.size())) {
        return ProtocolError::kNone;
    }

    size_t tml = load_u16(message.data() + 2);
    if (tml < HEADER_SIZE) return ProtocolError::kInvalidLength;

    return read_body(fd, tml, message, {});
}

} // namespace billwire
