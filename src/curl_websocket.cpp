#include "curl_websocket.h"
#include "logger.h"
#include <curl/curl.h>
#include <poll.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>

namespace parley {

namespace {

constexpr int POLL_INTERVAL_MS = 20;
constexpr size_t RECV_BUFFER_SIZE = 16384;

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// The frame-metadata out-parameter of curl_ws_recv became const-qualified in
// later libcurl releases; deduce whichever this build declares
template <typename FrameT>
CURLcode ws_recv(CURLcode (*recv_fn)(CURL*, void*, size_t, size_t*, FrameT**),
                 CURL* curl, void* buffer, size_t length, size_t* received,
                 const curl_ws_frame** meta) {
    FrameT* frame = nullptr;
    CURLcode rc = recv_fn(curl, buffer, length, received, &frame);
    *meta = frame;
    return rc;
}

} // anonymous namespace

class CurlWebSocket::Impl {
public:
    Impl(EventLoop& loop, int connect_timeout_ms)
        : loop_(loop), connect_timeout_ms_(connect_timeout_ms) {
        ensure_curl_global_init();
    }

    ~Impl() {
        close_requested_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void set_handlers(Handlers handlers) {
        handlers_ = std::move(handlers);
    }

    VoidResult open(const std::string& url) {
        if (thread_.joinable()) {
            return make_state_error("socket already opened");
        }
        if (url.empty()) {
            return make_error(ErrorType::ConfigError, "empty socket URL");
        }
        thread_ = std::thread([this, url]() { run(url); });
        return VoidResult();
    }

    VoidResult send(const std::string& text) {
        if (close_requested_ || finished_) {
            return make_transport_error("socket is closed");
        }
        std::lock_guard<std::mutex> lock(send_mutex_);
        send_queue_.push_back(text);
        return VoidResult();
    }

    void close() {
        close_requested_ = true;
    }

private:
    using Emit = std::function<void(Handlers&)>;

    void emit(Emit fn) {
        std::weak_ptr<bool> alive = alive_;
        loop_.post([this, alive, fn]() {
            if (alive.expired()) return;
            Handlers handlers = handlers_;
            fn(handlers);
        });
    }

    void emit_error(const std::string& message) {
        LOG_SYNTH("Socket error: " + message);
        emit([message](Handlers& h) { if (h.on_error) h.on_error(message); });
    }

    /// Abort a pending connect as soon as close() is requested
    static int progress_callback(void* user_data, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        Impl* self = static_cast<Impl*>(user_data);
        return self->close_requested_ ? 1 : 0;
    }

    bool send_frame(CURL* curl, const std::string& payload, unsigned int flags) {
        size_t offset = 0;
        while (true) {
            size_t sent = 0;
            CURLcode rc = curl_ws_send(curl, payload.data() + offset, payload.size() - offset,
                                       &sent, 0, flags);
            if (rc == CURLE_AGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (rc != CURLE_OK) {
                emit_error(std::string("send failed: ") + curl_easy_strerror(rc));
                return false;
            }
            offset += sent;
            if (offset >= payload.size()) return true;
        }
    }

    bool flush_sends(CURL* curl) {
        std::deque<std::string> pending;
        {
            std::lock_guard<std::mutex> lock(send_mutex_);
            pending.swap(send_queue_);
        }
        for (const auto& payload : pending) {
            if (!send_frame(curl, payload, CURLWS_TEXT)) return false;
        }
        return true;
    }

    /// Drain readable frames; returns false once the connection is finished
    bool receive(CURL* curl) {
        char buffer[RECV_BUFFER_SIZE];
        while (true) {
            size_t received = 0;
            const curl_ws_frame* meta = nullptr;
            CURLcode rc = ws_recv(&curl_ws_recv, curl, buffer, sizeof(buffer), &received, &meta);
            if (rc == CURLE_AGAIN) return true;
            if (rc == CURLE_GOT_NOTHING) {
                LOG_SYNTH("Peer closed the connection");
                return false;
            }
            if (rc != CURLE_OK) {
                emit_error(std::string("receive failed: ") + curl_easy_strerror(rc));
                return false;
            }
            if (!meta) continue;

            if (meta->flags & CURLWS_CLOSE) {
                LOG_SYNTH("Close frame received");
                return false;
            }
            if (meta->flags & CURLWS_PING) {
                continue;  // libcurl answers pings itself
            }

            message_.append(buffer, received);
            bool frame_done = meta->bytesleft == 0;
            bool message_done = frame_done && !(meta->flags & CURLWS_CONT);
            if (message_done) {
                std::string message;
                message.swap(message_);
                emit([message](Handlers& h) { if (h.on_message) h.on_message(message); });
            }
        }
    }

    void run(const std::string& url) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            emit_error("curl_easy_init failed");
            finish(nullptr);
            return;
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);  // 2 = WebSocket upgrade
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            if (!close_requested_) {
                emit_error(std::string("connect failed: ") + curl_easy_strerror(res));
            }
            finish(curl);
            return;
        }

        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
        LOG_SYNTH("Socket open (HTTP " + std::to_string(response_code) + ")");
        emit([](Handlers& h) { if (h.on_open) h.on_open(); });

        curl_socket_t sockfd = CURL_SOCKET_BAD;
        curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sockfd);

        while (!close_requested_) {
            if (!flush_sends(curl)) break;

            if (sockfd != CURL_SOCKET_BAD) {
                struct pollfd pfd;
                pfd.fd = sockfd;
                pfd.events = POLLIN;
                pfd.revents = 0;
                int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
                if (ready < 0) {
                    emit_error("poll failed");
                    break;
                }
                if (ready == 0) continue;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
            }

            if (!receive(curl)) break;
        }

        if (close_requested_) {
            // Best effort; the peer may already be gone
            size_t sent = 0;
            curl_ws_send(curl, "", 0, &sent, 0, CURLWS_CLOSE);
        }
        finish(curl);
    }

    void finish(CURL* curl) {
        if (curl) curl_easy_cleanup(curl);
        finished_ = true;
        emit([](Handlers& h) { if (h.on_close) h.on_close(); });
    }

    EventLoop& loop_;
    int connect_timeout_ms_;
    Handlers handlers_;

    std::thread thread_;
    std::atomic<bool> close_requested_{false};
    std::atomic<bool> finished_{false};

    std::mutex send_mutex_;
    std::deque<std::string> send_queue_;

    // Only touched by the worker thread
    std::string message_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

CurlWebSocket::CurlWebSocket(EventLoop& loop, int connect_timeout_ms)
    : pimpl_(std::make_unique<Impl>(loop, connect_timeout_ms)) {}

CurlWebSocket::~CurlWebSocket() = default;

void CurlWebSocket::set_handlers(Handlers handlers) {
    pimpl_->set_handlers(std::move(handlers));
}

VoidResult CurlWebSocket::open(const std::string& url) {
    return pimpl_->open(url);
}

VoidResult CurlWebSocket::send(const std::string& text) {
    return pimpl_->send(text);
}

void CurlWebSocket::close() {
    pimpl_->close();
}

} // namespace parley
