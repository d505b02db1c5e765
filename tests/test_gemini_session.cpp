/**
 * GeminiLiveSession over a real libcurl websocket, against an in-process
 * loopback peer speaking just enough RFC 6455 for the session.
 */

#include "gemini_live_session.h"
#include "test_support.h"
#include "utils.h"
#include <arpa/inet.h>
#include <array>
#include <atomic>
#include <cctype>
#include <cstring>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace live_relay;
using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

long long elapsed_ms(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count();
}

std::array<uint8_t, 20> sha1_digest(const std::string& input) {
    uint32_t h[5] = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};

    std::string msg = input;
    uint64_t bit_len = static_cast<uint64_t>(input.size()) * 8;
    msg += static_cast<char>(0x80);
    while (msg.size() % 64 != 56) msg += '\0';
    for (int i = 7; i >= 0; --i) msg += static_cast<char>((bit_len >> (i * 8)) & 0xFF);

    auto rol = [](uint32_t v, int n) { return (v << n) | (v >> (32 - n)); };
    for (size_t chunk = 0; chunk < msg.size(); chunk += 64) {
        uint32_t w[80];
        for (int i = 0; i < 16; ++i) {
            const auto* p = reinterpret_cast<const uint8_t*>(msg.data() + chunk + 4 * i);
            w[i] = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
        }
        for (int i = 16; i < 80; ++i) w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

        uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];
        for (int i = 0; i < 80; ++i) {
            uint32_t f, k;
            if (i < 20)      { f = (b & c) | (~b & d);           k = 0x5A827999; }
            else if (i < 40) { f = b ^ c ^ d;                    k = 0x6ED9EBA1; }
            else if (i < 60) { f = (b & c) | (b & d) | (c & d);  k = 0x8F1BBCDC; }
            else             { f = b ^ c ^ d;                    k = 0xCA62C1D6; }
            uint32_t temp = rol(a, 5) + f + e + k + w[i];
            e = d; d = c; c = rol(b, 30); b = a; a = temp;
        }
        h[0] += a; h[1] += b; h[2] += c; h[3] += d; h[4] += e;
    }

    std::array<uint8_t, 20> out;
    for (int i = 0; i < 5; ++i) {
        out[4 * i] = static_cast<uint8_t>(h[i] >> 24);
        out[4 * i + 1] = static_cast<uint8_t>(h[i] >> 16);
        out[4 * i + 2] = static_cast<uint8_t>(h[i] >> 8);
        out[4 * i + 3] = static_cast<uint8_t>(h[i]);
    }
    return out;
}

std::string websocket_accept(const std::string& key) {
    auto digest = sha1_digest(key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11");
    return utils::base64_encode(digest.data(), digest.size());
}

/**
 * Accepts one connection, completes the upgrade, then runs a script on
 * its own thread. Every read is bounded so a broken client cannot hang
 * the test.
 */
class LoopbackPeer {
public:
    using Script = std::function<void(LoopbackPeer&)>;

    LoopbackPeer() {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        // Inherited by the accepted socket; a tiny window fills up quickly once we stop reading
        int small = 4096;
        setsockopt(listen_fd_, SOL_SOCKET, SO_RCVBUF, &small, sizeof(small));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackPeer() {
        release();
        join();
        if (conn_fd_ >= 0) ::close(conn_fd_);
        if (listen_fd_ >= 0) ::close(listen_fd_);
    }

    std::string endpoint() const {
        return "ws://127.0.0.1:" + std::to_string(port_) + "/ws";
    }

    void serve(Script script) {
        thread_ = std::thread([this, script] {
            if (accept_and_upgrade()) {
                script(*this);
            }
        });
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    /// Ends hold()
    void release() { released_ = true; }

    /// Keep the connection open without reading until release()
    void hold() {
        while (!released_) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    /// Next data or close frame from the client, unmasked. Pings are skipped.
    bool read_frame(int& opcode, std::string& payload, int timeout_ms = 5000) {
        while (true) {
            std::string head;
            if (!recv_exact(2, head, timeout_ms)) return false;
            auto b0 = static_cast<uint8_t>(head[0]);
            auto b1 = static_cast<uint8_t>(head[1]);
            opcode = b0 & 0x0F;
            bool masked = (b1 & 0x80) != 0;
            uint64_t len = b1 & 0x7F;

            std::string ext;
            if (len == 126) {
                if (!recv_exact(2, ext, timeout_ms)) return false;
                len = (uint64_t(uint8_t(ext[0])) << 8) | uint8_t(ext[1]);
            } else if (len == 127) {
                if (!recv_exact(8, ext, timeout_ms)) return false;
                len = 0;
                for (char c : ext) len = (len << 8) | uint8_t(c);
            }

            std::string mask;
            if (masked && !recv_exact(4, mask, timeout_ms)) return false;
            if (!recv_exact(static_cast<size_t>(len), payload, timeout_ms)) return false;
            if (masked) {
                for (size_t i = 0; i < payload.size(); ++i) payload[i] ^= mask[i % 4];
            }
            if (opcode != 0x9) return true;
        }
    }

    bool write_text(const std::string& text) {
        std::string frame;
        frame += static_cast<char>(0x81);
        if (text.size() < 126) {
            frame += static_cast<char>(text.size());
        } else if (text.size() < 65536) {
            frame += static_cast<char>(126);
            frame += static_cast<char>((text.size() >> 8) & 0xFF);
            frame += static_cast<char>(text.size() & 0xFF);
        } else {
            frame += static_cast<char>(127);
            for (int i = 7; i >= 0; --i) frame += static_cast<char>((uint64_t(text.size()) >> (i * 8)) & 0xFF);
        }
        frame += text;
        return send_all(frame);
    }

private:
    bool accept_and_upgrade() {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (poll(&pfd, 1, 5000) <= 0) return false;
        conn_fd_ = accept(listen_fd_, nullptr, nullptr);
        if (conn_fd_ < 0) return false;

        std::string request;
        size_t end = std::string::npos;
        while ((end = inbox_.find("\r\n\r\n")) == std::string::npos) {
            if (!fill(5000)) return false;
        }
        request = inbox_.substr(0, end);
        inbox_.erase(0, end + 4);

        std::string lower = request;
        for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const std::string header = "sec-websocket-key:";
        size_t at = lower.find(header);
        if (at == std::string::npos) return false;
        size_t value_start = at + header.size();
        size_t value_end = request.find("\r\n", value_start);
        std::string key = request.substr(value_start, value_end - value_start);
        while (!key.empty() && key.front() == ' ') key.erase(0, 1);
        while (!key.empty() && key.back() == ' ') key.pop_back();

        return send_all("HTTP/1.1 101 Switching Protocols\r\n"
                        "Upgrade: websocket\r\n"
                        "Connection: Upgrade\r\n"
                        "Sec-WebSocket-Accept: " + websocket_accept(key) + "\r\n\r\n");
    }

    bool fill(int timeout_ms) {
        pollfd pfd{conn_fd_, POLLIN, 0};
        if (poll(&pfd, 1, timeout_ms) <= 0) return false;
        char chunk[4096];
        ssize_t n = recv(conn_fd_, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        inbox_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    bool recv_exact(size_t n, std::string& out, int timeout_ms) {
        while (inbox_.size() < n) {
            if (!fill(timeout_ms)) return false;
        }
        out = inbox_.substr(0, n);
        inbox_.erase(0, n);
        return true;
    }

    bool send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(conn_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    int listen_fd_ = -1;
    int conn_fd_ = -1;
    int port_ = 0;
    std::string inbox_;
    std::atomic<bool> released_{false};
    std::thread thread_;
};

const char* SETUP_COMPLETE = R"({"setupComplete":{}})";

// Reads the setup message, confirms it, then stops reading for good
void stall_after_setup(LoopbackPeer& peer) {
    int opcode = 0;
    std::string setup;
    if (!peer.read_frame(opcode, setup)) return;
    peer.write_text(SETUP_COMPLETE);
    peer.hold();
}

SessionConfig loopback_config(const LoopbackPeer& peer) {
    SessionConfig config;
    config.endpoint = peer.endpoint();
    config.api_key = "test-key";
    config.connect_timeout_ms = 3000;
    return config;
}

MediaFrame large_frame() {
    MediaFrame frame;
    frame.mime_type = "image/jpeg";
    frame.payload.assign(256 * 1024, 0x5A);
    frame.captured_at = Clock::now();
    return frame;
}

} // namespace

int main() {
    GeminiSessionFactory factory;

    // --- upgrade handshake digest (RFC 6455 sample) ---
    ASSERT(websocket_accept("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");

    // --- missing API key is refused before connecting ---
    {
        SessionConfig config;
        config.endpoint = "ws://127.0.0.1:9/ws";
        auto session = factory.connect(config);
        ASSERT(session.is_error());
        ASSERT(session.error().type == ErrorType::InvalidState);
    }

    // --- setup, inbound turn, outbound text, close frame ---
    {
        LoopbackPeer peer;
        std::string setup_text;
        std::string client_text;
        int close_opcode = -1;
        peer.serve([&](LoopbackPeer& p) {
            int opcode = 0;
            if (!p.read_frame(opcode, setup_text)) return;
            p.write_text(SETUP_COMPLETE);
            p.write_text(R"({"serverContent":{"modelTurn":{"parts":[{"text":"hello"}]},"turnComplete":true}})");
            if (!p.read_frame(opcode, client_text)) return;
            std::string ignored;
            if (p.read_frame(opcode, ignored)) close_opcode = opcode;
        });

        auto session = factory.connect(loopback_config(peer));
        ASSERT(session.is_ok());
        if (session.is_ok()) {
            AISession& ai = *session.value();
            StopToken stop;
            auto first = ai.receive(stop);
            ASSERT(first && std::holds_alternative<TextDelta>(*first));
            if (first && std::holds_alternative<TextDelta>(*first)) {
                ASSERT(std::get<TextDelta>(*first).text == "hello");
            }
            auto second = ai.receive(stop);
            ASSERT(second && std::holds_alternative<TurnComplete>(*second));

            ASSERT(ai.send_client_content("hi there", true).is_ok());
            ai.close();
            ai.close();
            auto late = ai.send_client_content("late", true);
            ASSERT(late.is_error() && late.error().message == "Session closed");
            ASSERT(!ai.receive(stop).has_value());
        }
        peer.join();

        json setup = json::parse(setup_text, nullptr, false);
        ASSERT(!setup.is_discarded() && setup.contains("setup"));
        json content = json::parse(client_text, nullptr, false);
        ASSERT(!content.is_discarded() && content.contains("clientContent"));
        if (!content.is_discarded() && content.contains("clientContent")) {
            ASSERT(content["clientContent"]["turns"][0]["parts"][0]["text"] == "hi there");
            ASSERT(content["clientContent"]["turnComplete"] == true);
        }
        ASSERT(close_opcode == 0x8);
    }

    // --- no setupComplete within the connect timeout ---
    {
        LoopbackPeer peer;
        peer.serve([](LoopbackPeer& p) {
            int opcode = 0;
            std::string setup;
            p.read_frame(opcode, setup);
            p.hold();
        });
        auto config = loopback_config(peer);
        config.connect_timeout_ms = 400;
        auto start = Clock::now();
        auto session = factory.connect(config);
        ASSERT(session.is_error() && session.error().type == ErrorType::Timeout);
        ASSERT(elapsed_ms(start) < 3000);
        peer.release();
    }

    // --- a peer that stops reading: sends time out, receive and close stay responsive ---
    {
        LoopbackPeer peer;
        peer.serve(stall_after_setup);
        auto config = loopback_config(peer);
        config.send_timeout_ms = 300;
        auto session = factory.connect(config);
        ASSERT(session.is_ok());
        if (session.is_ok()) {
            AISession& ai = *session.value();
            StopToken stop;
            std::atomic<bool> receiver_done{false};
            std::thread receiver([&] {
                ai.receive(stop);
                receiver_done = true;
            });

            MediaFrame frame = large_frame();
            int delivered = 0;
            long long failing_send_ms = -1;
            ErrorType failure = ErrorType::Unknown;
            for (int i = 0; i < 200; ++i) {
                auto start = Clock::now();
                auto sent = ai.send_realtime_media(frame);
                if (sent.is_error()) {
                    failing_send_ms = elapsed_ms(start);
                    failure = sent.error().type;
                    break;
                }
                delivered++;
            }
            ASSERT(delivered < 200);
            ASSERT(failure == ErrorType::Timeout);
            ASSERT(failing_send_ms >= 0 && failing_send_ms < 2000);

            // The abandoned frame leaves the stream unusable
            auto after = ai.send_client_content("x", true);
            ASSERT(after.is_error() && after.error().type == ErrorType::NetworkError);

            stop.request_stop();
            ASSERT(wait_until([&] { return receiver_done.load(); }));
            receiver.join();

            auto start = Clock::now();
            ai.close();
            ASSERT(elapsed_ms(start) < 1500);
        }
        peer.release();
    }

    // --- close() frees a sender stuck on a full socket ---
    {
        LoopbackPeer peer;
        peer.serve(stall_after_setup);
        auto config = loopback_config(peer);
        config.send_timeout_ms = 10000;
        auto session = factory.connect(config);
        ASSERT(session.is_ok());
        if (session.is_ok()) {
            AISession& ai = *session.value();
            MediaFrame frame = large_frame();
            std::atomic<long long> blocked_since{0};
            std::atomic<bool> sender_done{false};
            std::string last_error;
            std::thread sender([&] {
                for (int i = 0; i < 200; ++i) {
                    blocked_since = now_ms();
                    auto sent = ai.send_realtime_media(frame);
                    blocked_since = 0;
                    if (sent.is_error()) {
                        last_error = sent.error().message;
                        break;
                    }
                }
                sender_done = true;
            });

            // One send has made no progress for a while: the socket is full
            ASSERT(wait_until([&] {
                long long since = blocked_since.load();
                return since != 0 && now_ms() - since > 300;
            }, 8000));

            auto start = Clock::now();
            ai.close();
            ASSERT(elapsed_ms(start) < 1500);
            ASSERT(wait_until([&] { return sender_done.load(); }, 1500));
            sender.join();
            ASSERT(last_error == "Session closed");
        }
        peer.release();
    }

    return finish("test_gemini_session");
}
