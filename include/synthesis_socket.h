#pragma once

#include "errors.h"
#include <functional>
#include <memory>
#include <string>

namespace parley {

/**
 * @brief Streaming text socket to the synthesis backend
 *
 * open() connects asynchronously: on success on_open fires, on failure
 * on_error then on_close. Every opened socket ends with exactly one
 * on_close, whether the peer closed, the transport failed, or close() was
 * called locally. Handlers run on the event loop thread; none fire after
 * the socket object is destroyed.
 */
class SynthesisSocket {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string& message)> on_message;
        std::function<void(const std::string& error)> on_error;
        std::function<void()> on_close;
    };

    virtual ~SynthesisSocket() = default;

    virtual void set_handlers(Handlers handlers) = 0;

    virtual VoidResult open(const std::string& url) = 0;

    /// Queue a text frame; frames sent before on_open go out once connected
    virtual VoidResult send(const std::string& text) = 0;

    virtual void close() = 0;
};

using SocketFactory = std::function<std::unique_ptr<SynthesisSocket>()>;

} // namespace parley
