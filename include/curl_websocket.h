#pragma once

#include "event_loop.h"
#include "synthesis_socket.h"
#include <memory>

namespace parley {

/**
 * @brief SynthesisSocket over libcurl's WebSocket API (CONNECT_ONLY mode)
 *
 * One worker thread per socket connects, flushes queued sends and polls for
 * inbound frames, reassembling fragmented messages before posting them to
 * the event loop.
 */
class CurlWebSocket : public SynthesisSocket {
public:
    CurlWebSocket(EventLoop& loop, int connect_timeout_ms);
    ~CurlWebSocket() override;

    // Non-copyable
    CurlWebSocket(const CurlWebSocket&) = delete;
    CurlWebSocket& operator=(const CurlWebSocket&) = delete;

    void set_handlers(Handlers handlers) override;
    VoidResult open(const std::string& url) override;
    VoidResult send(const std::string& text) override;
    void close() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
