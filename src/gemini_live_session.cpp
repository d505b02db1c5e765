#include "gemini_live_session.h"
#include "core/constants.h"
#include "gemini_protocol.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <curl/curl.h>
#include <deque>
#include <mutex>
#include <poll.h>
#include <stdexcept>

namespace live_relay {

namespace {

constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;
constexpr int SEND_POLL_MS = 10;

// Outcome of one attempt to read a complete websocket message
enum class ReadStatus {
    Message,
    NoData,
    Closed
};

} // namespace

class GeminiLiveSession::Impl {
public:
    Impl(CURL* curl, int send_timeout_ms) : curl_(curl), send_timeout_ms_(send_timeout_ms) {
        // The socket stays open until curl_easy_cleanup, so it can be polled without curl_mutex_
        if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sockfd_) != CURLE_OK) {
            sockfd_ = CURL_SOCKET_BAD;
        }
    }

    ~Impl() {
        close();
        std::lock_guard<std::mutex> lock(curl_mutex_);
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
    }

    Result<void> send_json(const nlohmann::json& message) {
        // Bounded by the send timeout, or by one poll slice once closed_ is set
        std::lock_guard<std::mutex> sending(send_mutex_);
        if (closed_) {
            return make_state_error("Session closed");
        }
        if (torn_) {
            return make_network_error("Websocket stream broken by an abandoned send");
        }
        return write_frame(message.dump(), CURLWS_TEXT, send_timeout_ms_);
    }

    Result<void> wait_for_setup(int timeout_ms) {
        auto start = std::chrono::steady_clock::now();
        while (ms_since(start) < timeout_ms) {
            std::string raw;
            ReadStatus status = read_message(raw, constants::pipeline::POLL_SLICE_MS);
            if (status == ReadStatus::Closed) {
                return make_network_error("Connection closed before setupComplete");
            }
            if (status == ReadStatus::NoData) continue;

            auto parsed = gemini::parse_server_message(raw);
            if (!parsed) {
                Logger::warn("[Session] " + parsed.error().message);
                continue;
            }
            if (parsed.value().setup_complete) {
                return Result<void>();
            }
        }
        return make_timeout_error("Timed out waiting for setupComplete");
    }

    std::optional<InboundEvent> receive(const StopToken& stop) {
        while (!closed_ && !stop.stop_requested()) {
            if (!pending_.empty()) {
                InboundEvent event = std::move(pending_.front());
                pending_.pop_front();
                return event;
            }

            std::string raw;
            ReadStatus status = read_message(raw, constants::pipeline::POLL_SLICE_MS);
            if (status == ReadStatus::NoData) continue;
            if (status == ReadStatus::Closed) {
                if (closed_ || stop.stop_requested()) break;
                throw std::runtime_error("Gemini session closed by server");
            }

            auto parsed = gemini::parse_server_message(raw);
            if (!parsed) {
                Logger::warn("[Session] Skipping frame: " + parsed.error().message);
                continue;
            }
            if (parsed.value().go_away) {
                LOG_SESSION("Server sent goAway");
            }
            for (auto& event : parsed.value().events) {
                pending_.push_back(std::move(event));
            }
        }
        return std::nullopt;
    }

    void close() {
        bool expected = false;
        if (!closed_.compare_exchange_strong(expected, true)) {
            return;
        }
        // A sender waiting on a full socket sees closed_ within one poll slice and gives up
        std::lock_guard<std::mutex> sending(send_mutex_);
        if (torn_) {
            Logger::debug("[Session] Close frame skipped: a frame was left half sent");
        } else {
            // Best effort; the socket is released in the destructor
            auto result = write_frame("", CURLWS_CLOSE, constants::session::CLOSE_TIMEOUT_MS);
            if (!result) {
                Logger::debug("[Session] Close frame not sent: " + result.error().message);
            }
        }
        LOG_SESSION("Session closed");
    }

private:
    // Caller holds send_mutex_. curl_mutex_ is held per libcurl call only, so the
    // receive task keeps reading while a send waits for the socket to drain.
    Result<void> write_frame(const std::string& payload, unsigned int flags, int timeout_ms) {
        size_t offset = 0;
        auto start = std::chrono::steady_clock::now();
        do {
            size_t sent = 0;
            CURLcode rc;
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                if (!curl_) {
                    return make_state_error("Session not connected");
                }
                rc = curl_ws_send(curl_, payload.data() + offset, payload.size() - offset,
                                  &sent, 0, flags);
            }
            bool stalled = rc == CURLE_AGAIN || (rc == CURLE_OK && sent == 0 && offset < payload.size());
            if (stalled) {
                bool closing = closed_ && !(flags & CURLWS_CLOSE);
                if (closing || ms_since(start) > timeout_ms) {
                    // Part of the frame may already be on the wire
                    torn_ = true;
                    if (closing) {
                        return make_state_error("Session closed");
                    }
                    return make_timeout_error("Websocket send timed out");
                }
                wait_socket(POLLOUT, SEND_POLL_MS);
                continue;
            }
            if (rc != CURLE_OK) {
                torn_ = true;
                return make_network_error(std::string("Websocket send failed: ") + curl_easy_strerror(rc));
            }
            offset += sent;
        } while (offset < payload.size());
        return Result<void>();
    }

    // Reads until one full message is assembled, the slice expires, or the peer closes.
    ReadStatus read_message(std::string& out, int slice_ms) {
        auto start = std::chrono::steady_clock::now();
        char buffer[RECV_BUFFER_SIZE];

        while (true) {
            size_t received = 0;
            const struct curl_ws_frame* meta = nullptr;
            CURLcode rc;
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                if (!curl_) return ReadStatus::Closed;
                rc = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);
            }

            if (rc == CURLE_AGAIN) {
                // Keep a partially received message; finish it within the next slice
                if (partial_.empty() && ms_since(start) >= slice_ms) {
                    return ReadStatus::NoData;
                }
                if (closed_) return ReadStatus::Closed;
                wait_socket(POLLIN, slice_ms);
                if (partial_.empty() && ms_since(start) >= slice_ms) {
                    return ReadStatus::NoData;
                }
                continue;
            }
            if (rc == CURLE_GOT_NOTHING || rc == CURLE_RECV_ERROR) {
                return ReadStatus::Closed;
            }
            if (rc != CURLE_OK) {
                throw std::runtime_error(std::string("Websocket receive failed: ") + curl_easy_strerror(rc));
            }
            if (!meta) continue;

            if (meta->flags & CURLWS_CLOSE) {
                return ReadStatus::Closed;
            }
            if (meta->flags & CURLWS_PING) {
                continue;  // libcurl answers pings itself
            }

            partial_.append(buffer, received);
            if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                out.swap(partial_);
                partial_.clear();
                return ReadStatus::Message;
            }
        }
    }

    void wait_socket(short events, int timeout_ms) {
        if (sockfd_ == CURL_SOCKET_BAD) return;

        struct pollfd pfd;
        pfd.fd = sockfd_;
        pfd.events = events;
        pfd.revents = 0;
        poll(&pfd, 1, timeout_ms);
    }

    CURL* curl_;
    curl_socket_t sockfd_ = CURL_SOCKET_BAD;
    const int send_timeout_ms_;
    std::mutex curl_mutex_;   // every curl_ws_send / curl_ws_recv
    std::mutex send_mutex_;   // one outgoing frame at a time
    bool torn_ = false;       // guarded by send_mutex_
    std::atomic<bool> closed_{false};
    std::deque<InboundEvent> pending_;  // receive task only
    std::string partial_;               // receive task only
};

Result<std::unique_ptr<AISession>> GeminiLiveSession::connect(const SessionConfig& config) {
    if (config.api_key.empty()) {
        return make_state_error(std::string("No API key: set ") + constants::session::API_KEY_ENV);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    std::string url = gemini::build_endpoint_url(config);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);  // websocket upgrade, then hand over the socket
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_SESSION("Connecting to " + config.endpoint + " (model " + config.model + ")");
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string reason = curl_easy_strerror(rc);
        curl_easy_cleanup(curl);
        return make_network_error("Websocket connect failed: " + reason);
    }

    auto impl = std::make_unique<Impl>(curl, config.send_timeout_ms);
    auto sent = impl->send_json(gemini::build_setup_message(config));
    if (!sent) {
        return sent.error();
    }
    auto ready = impl->wait_for_setup(config.connect_timeout_ms);
    if (!ready) {
        return ready.error();
    }

    LOG_SESSION("Session ready");
    return std::unique_ptr<AISession>(std::make_unique<GeminiLiveSession>(PrivateTag{}, std::move(impl)));
}

GeminiLiveSession::GeminiLiveSession(PrivateTag, std::unique_ptr<Impl> impl) : pimpl_(std::move(impl)) {}

GeminiLiveSession::~GeminiLiveSession() = default;

Result<void> GeminiLiveSession::send_realtime_audio(const AudioChunk& chunk) {
    return pimpl_->send_json(gemini::build_audio_input(chunk));
}

Result<void> GeminiLiveSession::send_realtime_media(const MediaFrame& frame) {
    return pimpl_->send_json(gemini::build_media_input(frame));
}

Result<void> GeminiLiveSession::send_client_content(const std::string& text, bool turn_complete) {
    return pimpl_->send_json(gemini::build_client_content(text, turn_complete));
}

std::optional<InboundEvent> GeminiLiveSession::receive(const StopToken& stop) {
    return pimpl_->receive(stop);
}

void GeminiLiveSession::close() {
    pimpl_->close();
}

GeminiSessionFactory::GeminiSessionFactory() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GeminiSessionFactory::~GeminiSessionFactory() {
    curl_global_cleanup();
}

Result<std::unique_ptr<AISession>> GeminiSessionFactory::connect(const SessionConfig& config) {
    return GeminiLiveSession::connect(config);
}

} // namespace live_relay
