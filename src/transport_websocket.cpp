// ============================================================================
// transport_websocket.cpp - implementation for transport_websocket.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file transport_websocket.cpp
 */

#include "usb2snes/transport/transport_websocket.hpp"
#include "usb2snes/log.hpp"

// OpenSSL libcrypto: SHA-1 + base64 for the handshake accept check
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <utility>

// POSIX sockets
#include <fcntl.h>         // fcntl O_NONBLOCK
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>
#include <netinet/tcp.h>   // TCP_NODELAY
#include <poll.h>          // poll(2) for every bounded wait
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>        // ::close

#ifndef MSG_NOSIGNAL
#  define MSG_NOSIGNAL 0
#endif

namespace usb2snes::transport {

static const char* TAG = "ws";

// RFC 6455 section 1.3: fixed GUID appended to the client key.
static const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

static constexpr std::size_t MAX_HANDSHAKE_BYTES = 16384;
static constexpr std::size_t READ_CHUNK          = 4096;
static constexpr int         CLOSE_WAIT_MS       = 500;   // wait for the server's close echo


// ---------------------------------------------------------------------------
// small helpers
// ---------------------------------------------------------------------------

static std::string base64(const unsigned char* in, std::size_t n) {
    std::string out(4 * ((n + 2) / 3) + 1, '\0');   // +1: EVP_EncodeBlock writes a NUL
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), in, static_cast<int>(n));
    out.resize(len > 0 ? static_cast<std::size_t>(len) : 0);
    return out;
}

static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](char c) { return c >= '0' && c <= '9'; });
}

static int remaining_ms(std::chrono::steady_clock::time_point deadline, bool has_deadline) {
    if (!has_deadline) return -1;                 // poll(-1): wait forever
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}


// ---------------------------------------------------------------------------
// parse_ws_uri()
// --------------
// ws://host[:port][/path]. Bracketed IPv6 literals keep their colons.
// ---------------------------------------------------------------------------
bool parse_ws_uri(const std::string& uri, WsUri& out, std::string& err) {
    static const std::string SCHEME = "ws://";

    if (uri.rfind("wss://", 0) == 0) { err = "tls_unsupported"; return false; }
    if (uri.compare(0, SCHEME.size(), SCHEME) != 0) { err = "bad_scheme"; return false; }

    std::string rest = uri.substr(SCHEME.size());
    std::size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);

    WsUri u;
    u.path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    std::string port_str;
    bool has_port = false;
    if (!authority.empty() && authority[0] == '[') {
        std::size_t close = authority.find(']');
        if (close == std::string::npos) { err = "bad_host"; return false; }
        u.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') { err = "bad_host"; return false; }
            port_str = after.substr(1);
            has_port = true;
        }
    } else {
        std::size_t colon = authority.rfind(':');
        if (colon == std::string::npos) {
            u.host = authority;
        } else {
            u.host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
            has_port = true;
        }
    }

    if (u.host.empty()) { err = "empty_host"; return false; }

    if (has_port) {
        if (!all_digits(port_str) || port_str.size() > 5) { err = "bad_port"; return false; }
        unsigned long p = std::stoul(port_str);
        if (p == 0 || p > 65535) { err = "bad_port"; return false; }
        u.port = static_cast<uint16_t>(p);
    }

    out = std::move(u);
    return true;
}

std::string websocket_accept_for(const std::string& key) {
    std::string s = key + WS_GUID;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(s.data()), s.size(), digest);
    return base64(digest, SHA_DIGEST_LENGTH);
}


// ---------------------------------------------------------------------------
// lifecycle
// ---------------------------------------------------------------------------

WebSocketTransport::WebSocketTransport()
: rng_(std::random_device{}()) {}

WebSocketTransport::~WebSocketTransport() {
    close();
}

bool WebSocketTransport::set_error(const std::string& why) {
    last_error_ = why;
    return false;
}

bool WebSocketTransport::open(const Config& cfg) {
    if (fd_ >= 0) release();

    cfg_ = cfg;
    dec_ = ws::decoder(cfg.max_message_bytes);
    last_error_.clear();
    close_sent_ = false;
    close_received_ = false;

    WsUri u;
    std::string err;
    if (!parse_ws_uri(cfg.uri, u, err)) return set_error(err);

    if (!connect_socket(u, cfg.connect_timeout_ms)) {
        U2S_LOGW(TAG, "connect to %s failed: %s", cfg.uri.c_str(), last_error_.c_str());
        return false;
    }
    if (!handshake(u, cfg.connect_timeout_ms)) {
        U2S_LOGW(TAG, "handshake with %s failed: %s", cfg.uri.c_str(), last_error_.c_str());
        release();
        return false;
    }

    U2S_LOGI(TAG, "connected to %s", cfg.uri.c_str());
    return true;
}

void WebSocketTransport::close() {
    if (fd_ < 0) return;

    if (!close_sent_) {
        const uint8_t normal[2] = {0x03, 0xE8};   // status 1000, normal closure
        if (send_raw_frame(ws::OP_CLOSE, normal, sizeof(normal)) == TxResult::Ok) {
            close_sent_ = true;
        }
    }

    // Give the server a moment to echo the close so both sides shut down cleanly.
    if (close_sent_ && !close_received_) {
        auto deadline = Clock::now() + std::chrono::milliseconds(CLOSE_WAIT_MS);
        ws::Frame f;
        while (next_frame(f, deadline, true) == RxResult::Ok) {
            if (f.opcode == ws::OP_CLOSE) { close_received_ = true; break; }
        }
    }

    U2S_LOGD(TAG, "closed (echo=%d)", close_received_ ? 1 : 0);
    release();
}

void WebSocketTransport::release() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    rx_.clear();
    rx_pos_ = 0;
    dec_.reset();
}


// ---------------------------------------------------------------------------
// connect_socket()
// ----------------
// Resolve host, try each address with a non-blocking connect bounded by
// poll(). The socket stays non-blocking; every later wait also uses poll().
// ---------------------------------------------------------------------------
bool WebSocketTransport::connect_socket(const WsUri& u, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(u.port);
    int gai = ::getaddrinfo(u.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) return set_error(std::string("resolve_failed: ") + ::gai_strerror(gai));

    int last_errno = 0;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) { last_errno = errno; continue; }

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
            last_errno = errno;
            ::close(fd);
            continue;
        }

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) {
            last_errno = errno;
            ::close(fd);
            continue;
        }
        if (rc != 0) {
            pollfd pfd{fd, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, timeout_ms);
            int so_error = 0;
            socklen_t so_len = sizeof(so_error);
            if (pr <= 0) {
                last_errno = (pr == 0) ? ETIMEDOUT : errno;
                ::close(fd);
                continue;
            }
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0) {
                last_errno = so_error ? so_error : errno;
                ::close(fd);
                continue;
            }
        }

        // Upload chunks must leave immediately; never coalesce them.
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
        if (last_errno == ETIMEDOUT) return set_error("timeout");
        return set_error(std::string("connect_failed: ") + std::strerror(last_errno));
    }
    return true;
}


// ---------------------------------------------------------------------------
// handshake()
// -----------
// HTTP/1.1 Upgrade. Requires "101" and a Sec-WebSocket-Accept matching our
// key. Any bytes the server sent after the header block are kept in rx_ as
// the start of the first frame.
// ---------------------------------------------------------------------------
bool WebSocketTransport::handshake(const WsUri& u, int timeout_ms) {
    std::array<unsigned char, 16> nonce{};
    for (auto& b : nonce) b = static_cast<unsigned char>(rng_() & 0xFF);
    const std::string key = base64(nonce.data(), nonce.size());

    std::string host = (u.host.find(':') != std::string::npos) ? "[" + u.host + "]" : u.host;
    if (u.port != 80) host += ":" + std::to_string(u.port);

    std::string req;
    req += "GET " + u.path + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n\r\n";

    if (!write_all(reinterpret_cast<const uint8_t*>(req.data()), req.size(), timeout_ms)) {
        return false;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    bool has_deadline = timeout_ms >= 0;

    std::string headers;
    std::size_t end = std::string::npos;
    char buf[1024];
    while ((end = headers.find("\r\n\r\n")) == std::string::npos) {
        if (headers.size() > MAX_HANDSHAKE_BYTES) return set_error("handshake_too_large");

        pollfd pfd{fd_, POLLIN, 0};
        int pr = ::poll(&pfd, 1, remaining_ms(deadline, has_deadline));
        if (pr == 0) return set_error("timeout");
        if (pr < 0) {
            if (errno == EINTR) continue;
            return set_error(std::string("poll_failed: ") + std::strerror(errno));
        }

        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) return set_error("handshake_eof");
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return set_error(std::string("recv_failed: ") + std::strerror(errno));
        }
        headers.append(buf, static_cast<std::size_t>(n));
    }

    rx_.assign(headers.begin() + static_cast<std::ptrdiff_t>(end + 4), headers.end());
    rx_pos_ = 0;
    headers.resize(end);

    // Status line: "HTTP/1.1 101 Switching Protocols"
    std::size_t eol = headers.find("\r\n");
    std::string status = headers.substr(0, eol);
    std::size_t sp = status.find(' ');
    if (sp == std::string::npos || status.compare(sp + 1, 3, "101") != 0) {
        return set_error("handshake_rejected: " + status);
    }

    std::string accept;
    std::size_t pos = (eol == std::string::npos) ? headers.size() : eol + 2;
    while (pos < headers.size()) {
        std::size_t next = headers.find("\r\n", pos);
        if (next == std::string::npos) next = headers.size();
        std::string line = headers.substr(pos, next - pos);
        std::size_t colon = line.find(':');
        if (colon != std::string::npos &&
            lower(trim(line.substr(0, colon))) == "sec-websocket-accept") {
            accept = trim(line.substr(colon + 1));
        }
        pos = next + 2;
    }

    if (accept != websocket_accept_for(key)) return set_error("bad_accept");

    U2S_LOGD(TAG, "handshake ok (%zu early bytes)", rx_.size());
    return true;
}


// ---------------------------------------------------------------------------
// send side
// ---------------------------------------------------------------------------

bool WebSocketTransport::write_all(const uint8_t* data, std::size_t len, int timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    bool has_deadline = timeout_ms >= 0;

    std::size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) { sent += static_cast<std::size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, remaining_ms(deadline, has_deadline));
            if (pr == 0) return set_error("timeout");
            if (pr < 0 && errno != EINTR) {
                return set_error(std::string("poll_failed: ") + std::strerror(errno));
            }
            continue;
        }
        return set_error(std::string("send_failed: ") + std::strerror(errno));
    }
    return true;
}

TxResult WebSocketTransport::send_raw_frame(uint8_t opcode, const uint8_t* data, std::size_t len) {
    std::array<uint8_t, 4> mask{};
    for (auto& b : mask) b = static_cast<uint8_t>(rng_() & 0xFF);

    std::vector<uint8_t> frame;
    ws::encode(opcode, data, len, mask, frame);
    return write_all(frame.data(), frame.size(), cfg_.io_timeout_ms) ? TxResult::Ok : TxResult::Error;
}

TxResult WebSocketTransport::send(FrameKind kind, const uint8_t* data, std::size_t len) {
    if (fd_ < 0)        { set_error("not_open"); return TxResult::Error; }
    if (close_received_) { set_error("closed");  return TxResult::Error; }
    uint8_t op = (kind == FrameKind::Text) ? ws::OP_TEXT : ws::OP_BINARY;
    return send_raw_frame(op, data, len);
}

// send() already hands every frame to the kernel in full and TCP_NODELAY is
// set, so there is nothing left to push.
TxResult WebSocketTransport::flush() {
    if (fd_ < 0) { set_error("not_open"); return TxResult::Error; }
    return TxResult::Ok;
}


// ---------------------------------------------------------------------------
// receive side
// ---------------------------------------------------------------------------

RxResult WebSocketTransport::fill(Clock::time_point deadline, bool has_deadline) {
    uint8_t buf[READ_CHUNK];
    while (true) {
        pollfd pfd{fd_, POLLIN, 0};
        int pr = ::poll(&pfd, 1, remaining_ms(deadline, has_deadline));
        if (pr == 0) { set_error("timeout"); return RxResult::Timeout; }
        if (pr < 0) {
            if (errno == EINTR) continue;
            set_error(std::string("poll_failed: ") + std::strerror(errno));
            return RxResult::Error;
        }

        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            rx_.assign(buf, buf + n);
            rx_pos_ = 0;
            return RxResult::Ok;
        }
        if (n == 0) { set_error("eof"); return RxResult::Closed; }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        set_error(std::string("recv_failed: ") + std::strerror(errno));
        return RxResult::Error;
    }
}

RxResult WebSocketTransport::next_frame(ws::Frame& frame, Clock::time_point deadline, bool has_deadline) {
    while (true) {
        while (rx_pos_ < rx_.size()) {
            if (dec_.feed(rx_[rx_pos_++], frame)) return RxResult::Ok;
            if (dec_.error()) { set_error("bad_frame"); return RxResult::Error; }
        }
        RxResult r = fill(deadline, has_deadline);
        if (r != RxResult::Ok) return r;
    }
}

// ---------------------------------------------------------------------------
// recv()
// ------
// Return the next complete text/binary message. Control frames are consumed
// here; continuation frames are appended until FIN.
// ---------------------------------------------------------------------------
RxResult WebSocketTransport::recv(DataFrame& out) {
    if (fd_ < 0)         { set_error("not_open"); return RxResult::Error; }
    if (close_received_) { set_error("closed");   return RxResult::Closed; }

    const bool has_deadline = cfg_.io_timeout_ms >= 0;
    const auto deadline = Clock::now() + std::chrono::milliseconds(has_deadline ? cfg_.io_timeout_ms : 0);

    std::vector<uint8_t> message;
    uint8_t message_op = ws::OP_TEXT;
    bool in_message = false;

    while (true) {
        ws::Frame f;
        RxResult r = next_frame(f, deadline, has_deadline);
        if (r != RxResult::Ok) return r;

        switch (f.opcode) {
            case ws::OP_PING:
                if (send_raw_frame(ws::OP_PONG, f.payload.data(), f.payload.size()) != TxResult::Ok) {
                    return RxResult::Error;
                }
                continue;

            case ws::OP_PONG:
                continue;

            case ws::OP_CLOSE:
                close_received_ = true;
                U2S_LOGI(TAG, "server closed the connection");
                if (!close_sent_) {
                    // Echo the status code (first two bytes) back, per RFC 6455 5.5.1.
                    std::size_t n = std::min<std::size_t>(f.payload.size(), 2);
                    if (send_raw_frame(ws::OP_CLOSE, f.payload.data(), n) == TxResult::Ok) {
                        close_sent_ = true;
                    }
                }
                set_error("closed");
                return RxResult::Closed;

            case ws::OP_TEXT:
            case ws::OP_BINARY:
                if (in_message) { set_error("unexpected_data_frame"); return RxResult::Error; }
                message_op = f.opcode;
                message = std::move(f.payload);
                if (!f.fin) { in_message = true; continue; }
                break;

            case ws::OP_CONTINUATION:
                if (!in_message) { set_error("unexpected_continuation"); return RxResult::Error; }
                if (f.payload.size() > cfg_.max_message_bytes - message.size()) {
                    set_error("message_too_large");
                    return RxResult::Error;
                }
                message.insert(message.end(), f.payload.begin(), f.payload.end());
                if (!f.fin) continue;
                in_message = false;
                break;

            default:
                set_error("unknown_opcode");
                return RxResult::Error;
        }

        out.kind = (message_op == ws::OP_TEXT) ? FrameKind::Text : FrameKind::Binary;
        out.data = std::move(message);
        return RxResult::Ok;
    }
}

} // namespace usb2snes::transport
