#pragma once

#include "billing/catalog.hpp"
#include "protocol/frame.hpp"
#include "util/logger.hpp"

namespace billwire {

// Serve a single exchange on client_fd: read one request, price it against
// catalog, send the bill or an ErrorResponse. A client that disconnects before
// a full header gets no reply. Closes the connection fd when done.
// With a receive timeout set on client_fd, keep_waiting is asked after every
// timeout whether to keep reading; a client it gives up on is treated as one
// that disconnected.
void handle_connection(int client_fd, const Catalog& catalog, const Logger& logger,
                       const ReadWaitFn& keep_waiting = {});

} // namespace billwire
