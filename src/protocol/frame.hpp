#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "protocol/messages.hpp"

namespace billwire {

// Low-level: write exactly n bytes to fd. Retries on EINTR.
bool write_all(int fd, const void* data, size_t n);

// Asked each time a read on an fd with a receive timeout comes back empty.
// Returning false ends the read as if the stream had closed.
using ReadWaitFn = std::function<bool()>;

// Low-level: read exactly n bytes from fd. Fails on EOF or error.
bool read_all(int fd, void* data, size_t n);

// Write a whole encoded message.
bool write_message(int fd, const std::vector<uint8_t>& message);

// Read one request from fd into message, using TML to know where it ends.
// Returns:
//   kTruncatedHeader  fewer than 4 bytes arrived (message holds what did)
//   kInvalidLength    TML < 6 (message holds the 4 header bytes)
//   kTruncatedBody    stream ended before TML bytes (message holds the header)
//   kNone             message holds exactly TML bytes
// If fd has a receive timeout, keep_waiting decides whether to go on after
// each timeout; an empty keep_waiting gives up on the first one.
ProtocolError read_request_message(int fd, std::vector<uint8_t>& message,
                                   const ReadWaitFn& keep_waiting = {});

// Read one server reply from fd into message. An error response is complete
// after its 4 bytes; a bill is read up to its TML.
// Returns kTruncatedHeader, kInvalidLength (TML < 4), kTruncatedBody or kNone.
ProtocolError read_response_message(int fd, std::vector<uint8_t>& message);

} // namespace billwire
