#include "websocket-frame.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/evp.h>

static const char* const kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool write_all_fd(int fd, const void* buf, size_t nbytes) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = send(fd, p + off, nbytes - off, MSG_NOSIGNAL);
        if (m < 0 && errno == EINTR) continue;
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}

HttpRequest parse_http_request(const std::string& raw_request) {
    HttpRequest request;
    std::istringstream stream(raw_request);
    std::string line;

    // Parse request line
    if (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::istringstream request_line(line);
        request_line >> request.method >> request.path;

        size_t query_pos = request.path.find('?');
        if (query_pos != std::string::npos) {
            request.path = request.path.substr(0, query_pos);
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string key = to_lower(line.substr(0, colon_pos));
            std::string value = line.substr(colon_pos + 1);
            // Trim whitespace
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);
            request.headers[key] = value;
        }
    }
    return request;
}

std::string compute_accept_key(const std::string& client_key) {
    std::string input = client_key + kWebSocketGuid;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return std::string();
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return std::string();

    // 4 output chars per 3 input bytes plus NUL
    std::vector<unsigned char> encoded(4 * ((digest_len + 2) / 3) + 1);
    int n = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digest_len));
    return std::string(reinterpret_cast<const char*>(encoded.data()), n);
}

static bool header_has_token(const HttpRequest& request, const std::string& name, const std::string& token) {
    auto it = request.headers.find(name);
    if (it == request.headers.end()) return false;
    std::string value = to_lower(it->second);
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) {
        part.erase(0, part.find_first_not_of(" \t"));
        part.erase(part.find_last_not_of(" \t") + 1);
        if (part == token) return true;
    }
    return false;
}

bool build_handshake_response(const HttpRequest& request, const std::string& expected_path,
                              std::string& response, std::string& error) {
    if (request.path != expected_path) {
        error = "unknown path " + request.path;
        response = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        return false;
    }

    auto key = request.headers.find("sec-websocket-key");
    if (request.method != "GET" || !header_has_token(request, "upgrade", "websocket") ||
        !header_has_token(request, "connection", "upgrade") || key == request.headers.end() ||
        key->second.empty()) {
        error = "not a websocket upgrade request";
        response = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        return false;
    }

    std::string accept = compute_accept_key(key->second);
    if (accept.empty()) {
        error = "failed to compute accept key";
        response = "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        return false;
    }

    response = "HTTP/1.1 101 Switching Protocols\r\n"
               "Upgrade: websocket\r\n"
               "Connection: Upgrade\r\n"
               "Sec-WebSocket-Accept: " + accept + "\r\n\r\n";
    return true;
}

std::string encode_frame(WsOpcode opcode, const std::string& payload, bool fin, const uint8_t* mask) {
    std::string out;
    out.reserve(payload.size() + 14);
    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

    uint8_t mask_bit = mask ? 0x80 : 0x00;
    uint64_t len = payload.size();
    if (len < 126) {
        out.push_back(static_cast<char>(mask_bit | len));
    } else if (len <= 0xFFFF) {
        out.push_back(static_cast<char>(mask_bit | 126));
        out.push_back(static_cast<char>((len >> 8) & 0xFF));
        out.push_back(static_cast<char>(len & 0xFF));
    } else {
        out.push_back(static_cast<char>(mask_bit | 127));
        for (int i = 7; i >= 0; --i) {
            out.push_back(static_cast<char>((len >> (8 * i)) & 0xFF));
        }
    }

    if (mask) {
        out.append(reinterpret_cast<const char*>(mask), 4);
        for (size_t i = 0; i < payload.size(); ++i) {
            out.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
        }
    } else {
        out += payload;
    }
    return out;
}

std::string encode_close_payload(uint16_t code, const std::string& reason) {
    std::string out;
    out.push_back(static_cast<char>((code >> 8) & 0xFF));
    out.push_back(static_cast<char>(code & 0xFF));
    out += reason;
    return out;
}

FrameReader::FrameReader(int fd, std::string buffered)
    : fd_(fd), buffer_(std::move(buffered)) {
}

bool FrameReader::fill(size_t want, std::string& error) {
    char chunk[16384];
    while (buffer_.size() < want) {
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) {
            error = "connection closed by peer";
            return false;
        }
        if (n < 0) {
            error = std::string("recv failed: ") + std::strerror(errno);
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
    return true;
}

bool FrameReader::read_exact(void* out, size_t n, std::string& error) {
    if (!fill(n, error)) return false;
    std::memcpy(out, buffer_.data(), n);
    buffer_.erase(0, n);
    return true;
}

bool FrameReader::read_http_request(std::string& raw_request, std::string& error) {
    const size_t max_header_bytes = 16384;
    for (;;) {
        size_t end = buffer_.find("\r\n\r\n");
        if (end != std::string::npos) {
            raw_request = buffer_.substr(0, end + 4);
            buffer_.erase(0, end + 4);
            return true;
        }
        if (buffer_.size() > max_header_bytes) {
            error = "request headers too large";
            return false;
        }
        if (!fill(buffer_.size() + 1, error)) return false;
    }
}

bool FrameReader::read_frame(WsFrame& frame, std::string& error) {
    uint8_t head[2];
    if (!read_exact(head, 2, error)) return false;

    if (head[0] & 0x70) {
        error = "reserved bits set";
        return false;
    }
    frame.fin = (head[0] & 0x80) != 0;
    frame.opcode = static_cast<WsOpcode>(head[0] & 0x0F);
    switch (frame.opcode) {
        case WsOpcode::Continuation:
        case WsOpcode::Text:
        case WsOpcode::Binary:
        case WsOpcode::Close:
        case WsOpcode::Ping:
        case WsOpcode::Pong:
            break;
        default:
            error = "unknown opcode " + std::to_string(head[0] & 0x0F);
            return false;
    }

    bool masked = (head[1] & 0x80) != 0;
    if (!masked) {
        error = "client frame is not masked";
        return false;
    }

    uint64_t len = head[1] & 0x7F;
    if (len == 126) {
        uint8_t ext[2];
        if (!read_exact(ext, 2, error)) return false;
        len = (uint64_t(ext[0]) << 8) | ext[1];
    } else if (len == 127) {
        uint8_t ext[8];
        if (!read_exact(ext, 8, error)) return false;
        len = 0;
        for (int i = 0; i < 8; ++i) len = (len << 8) | ext[i];
    }

    if (is_control_opcode(frame.opcode) && (len > 125 || !frame.fin)) {
        error = "invalid control frame";
        return false;
    }
    if (len > kMaxMessageBytes) {
        error = "frame of " + std::to_string(len) + " bytes exceeds limit";
        return false;
    }

    uint8_t mask[4];
    if (!read_exact(mask, 4, error)) return false;

    if (!fill(static_cast<size_t>(len), error)) return false;
    frame.payload.assign(buffer_.data(), static_cast<size_t>(len));
    buffer_.erase(0, static_cast<size_t>(len));
    for (size_t i = 0; i < frame.payload.size(); ++i) {
        frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
    }
    return true;
}

bool FrameReader::read_message(WsMessage& message, std::string& error) {
    for (;;) {
        WsFrame frame;
        if (!read_frame(frame, error)) return false;

        if (is_control_opcode(frame.opcode)) {
            message.opcode = frame.opcode;
            message.payload = std::move(frame.payload);
            return true;
        }

        if (frame.opcode == WsOpcode::Continuation) {
            if (!in_message_) {
                error = "continuation frame without a message";
                return false;
            }
        } else {
            if (in_message_) {
                error = "new message started before previous one finished";
                return false;
            }
            in_message_ = true;
            message_opcode_ = frame.opcode;
            message_payload_.clear();
        }

        if (message_payload_.size() + frame.payload.size() > kMaxMessageBytes) {
            error = "message exceeds " + std::to_string(kMaxMessageBytes) + " bytes";
            return false;
        }
        message_payload_ += frame.payload;

        if (frame.fin) {
            in_message_ = false;
            message.opcode = message_opcode_;
            message.payload = std::move(message_payload_);
            message_payload_.clear();
            return true;
        }
    }
}
