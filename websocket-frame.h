#pragma once

#include <cstdint>
#include <map>
#include <string>

// RFC 6455 framing over a connected POSIX socket

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;  // keys lower-cased
};

HttpRequest parse_http_request(const std::string& raw_request);

// base64(SHA-1(key + GUID)) for the Sec-WebSocket-Accept header
std::string compute_accept_key(const std::string& client_key);

// Checks the upgrade headers; on success `response` holds the 101 reply,
// otherwise a 400/404 reply to send before closing.
bool build_handshake_response(const HttpRequest& request, const std::string& expected_path,
                              std::string& response, std::string& error);

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

inline bool is_control_opcode(WsOpcode op) { return (static_cast<uint8_t>(op) & 0x8) != 0; }

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

// A whole data message, or a single control frame
struct WsMessage {
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

constexpr size_t kMaxMessageBytes = 32u * 1024u * 1024u;

// Server frames are sent unmasked; `mask` is for the client side (tests)
std::string encode_frame(WsOpcode opcode, const std::string& payload, bool fin = true,
                         const uint8_t* mask = nullptr);

// Close frame payload: 2-byte status code plus optional reason
std::string encode_close_payload(uint16_t code, const std::string& reason = "");

class FrameReader {
public:
    // `buffered` holds bytes already read past the handshake
    explicit FrameReader(int fd, std::string buffered = "");

    // Reads the HTTP upgrade request (up to the blank line)
    bool read_http_request(std::string& raw_request, std::string& error);

    bool read_frame(WsFrame& frame, std::string& error);

    // Reassembles fragmented data messages. Control frames that arrive between
    // fragments are returned as they come.
    bool read_message(WsMessage& message, std::string& error);

private:
    bool fill(size_t want, std::string& error);
    bool read_exact(void* out, size_t n, std::string& error);

    int fd_;
    std::string buffer_;
    // In-progress fragmented message
    bool in_message_ = false;
    WsOpcode message_opcode_ = WsOpcode::Text;
    std::string message_payload_;
};

bool write_all_fd(int fd, const void* buf, size_t nbytes);
