#include "websocket-server.h"

#include <iostream>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

WebSocketConnection::WebSocketConnection(int fd) : fd_(fd), open_(true) {}

WebSocketConnection::~WebSocketConnection() {
    close();
}

bool WebSocketConnection::send_frame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!open_.load()) {
        return false;
    }
    if (!write_all_fd(fd_, frame.data(), frame.size())) {
        open_.store(false);
        return false;
    }
    return true;
}

bool WebSocketConnection::send_text(const std::string& message) {
    return send_frame(encode_frame(WsOpcode::Text, message));
}

bool WebSocketConnection::send_binary(const std::string& payload) {
    return send_frame(encode_frame(WsOpcode::Binary, payload));
}

bool WebSocketConnection::send_pong(const std::string& payload) {
    return send_frame(encode_frame(WsOpcode::Pong, payload));
}

bool WebSocketConnection::send_close(uint16_t code, const std::string& reason) {
    return send_frame(encode_frame(WsOpcode::Close, encode_close_payload(code, reason)));
}

void WebSocketConnection::close() {
    // Wait out a send in progress so the frame is not cut mid-way
    std::lock_guard<std::mutex> lock(send_mutex_);
    open_.store(false);
    ::shutdown(fd_, SHUT_RDWR);
}

VoiceChatServer::VoiceChatServer(const ServerConfig& config, const Collaborators& collaborators)
    : config_(config), collaborators_(collaborators), store_(default_system_directive()),
      server_socket_(-1), running_(false) {
}

VoiceChatServer::~VoiceChatServer() {
    stop();
}

bool VoiceChatServer::start() {
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        std::cerr << "❌ Failed to create socket" << std::endl;
        return false;
    }

    // Allow socket reuse
    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(config_.port);

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        std::cerr << "❌ Failed to bind to port " << config_.port << std::endl;
        ::close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 16) < 0) {
        std::cerr << "❌ Failed to listen on socket" << std::endl;
        ::close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    running_ = true;
    server_thread_ = std::thread(&VoiceChatServer::server_loop, this);
    eviction_thread_ = std::thread(&VoiceChatServer::eviction_loop, this);

    std::cout << "🚀 Voice chat server listening on ws://0.0.0.0:" << config_.port << config_.path << std::endl;
    return true;
}

void VoiceChatServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    std::cout << "🛑 Stopping voice chat server..." << std::endl;

    if (server_socket_ >= 0) {
        ::shutdown(server_socket_, SHUT_RDWR);
        ::close(server_socket_);
        server_socket_ = -1;
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(eviction_mutex_);
        eviction_cv_.notify_all();
    }
    if (eviction_thread_.joinable()) {
        eviction_thread_.join();
    }

    // Unblock every reader and wait for the handlers to tear their sessions down
    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (int fd : client_sockets_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    clients_cv_.wait(lock, [this] { return client_sockets_.empty(); });

    std::cout << "✅ Voice chat server stopped" << std::endl;
}

void VoiceChatServer::server_loop() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (running_) {
                std::cerr << "⚠️ Failed to accept client connection" << std::endl;
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            if (!running_) {
                ::close(client_socket);
                break;
            }
            client_sockets_.insert(client_socket);
        }

        // Handle client in separate thread
        std::thread client_thread(&VoiceChatServer::handle_client, this, client_socket);
        client_thread.detach();
    }
}

void VoiceChatServer::eviction_loop() {
    std::unique_lock<std::mutex> lock(eviction_mutex_);
    while (running_) {
        eviction_cv_.wait_for(lock, config_.eviction_interval, [this] { return !running_.load(); });
        if (!running_) break;
        store_.evict_idle(config_.session_timeout);
    }
}

void VoiceChatServer::handle_client(int client_socket) {
    int nodelay = 1;
    setsockopt(client_socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    FrameReader reader(client_socket);
    std::string raw_request;
    std::string error;
    if (reader.read_http_request(raw_request, error)) {
        HttpRequest request = parse_http_request(raw_request);
        std::string response;
        if (build_handshake_response(request, config_.path, response, error)) {
            if (write_all_fd(client_socket, response.data(), response.size())) {
                WebSocketConnection conn(client_socket);
                serve_session(client_socket, conn, reader);
            }
        } else {
            std::cout << "⚠️ Rejected connection: " << error << std::endl;
            write_all_fd(client_socket, response.data(), response.size());
        }
    } else if (config_.verbose) {
        std::cout << "⚠️ Handshake read failed: " << error << std::endl;
    }

    // Close under the lock so stop() never shuts down a reused descriptor
    std::lock_guard<std::mutex> lock(clients_mutex_);
    client_sockets_.erase(client_socket);
    ::close(client_socket);
    clients_cv_.notify_all();
}

void VoiceChatServer::serve_session(int client_socket, WebSocketConnection& conn, FrameReader& reader) {
    const std::string session_id = store_.create_session();
    const std::string tag = "[" + session_id.substr(0, 8) + "]";
    std::cout << "✅ " << tag << " WebSocket connection opened (fd " << client_socket << "), "
              << store_.session_count() << " active session(s)" << std::endl;

    TurnOrchestrator orchestrator(store_, session_id, conn, collaborators_, config_.orchestrator);

    std::string error;
    bool session_lost = false;
    for (;;) {
        WsMessage message;
        if (!reader.read_message(message, error)) {
            if (running_ && error != "connection closed by peer") {
                std::cout << "⚠️ " << tag << " WebSocket error: " << error << std::endl;
                conn.send_close(1002, "protocol error");
            }
            break;
        }

        if (message.opcode == WsOpcode::Binary) {
            if (!orchestrator.on_audio_frame(message.payload)) {
                session_lost = true;
                break;
            }
        } else if (message.opcode == WsOpcode::Text) {
            ControlMessage control = parse_control_message(message.payload);
            if (control.action == ControlAction::Ping) {
                conn.send_text(make_event("pong"));
            } else if (control.action == ControlAction::StopRecording) {
                if (!orchestrator.on_stop_recording()) {
                    session_lost = true;
                    break;
                }
            } else if (control.action == ControlAction::Unknown) {
                std::cout << "⚠️ " << tag << " Ignoring unknown control message: " << control.detail << std::endl;
            } else {
                std::cout << "⚠️ " << tag << " " << turn_error_name(TurnError::MalformedControlMessage)
                          << ": " << control.detail << std::endl;
            }
        } else if (message.opcode == WsOpcode::Ping) {
            conn.send_pong(message.payload);
        } else if (message.opcode == WsOpcode::Close) {
            // Echo the status code back
            conn.send_close(message.payload.size() >= 2
                                ? static_cast<uint16_t>((uint8_t(message.payload[0]) << 8) | uint8_t(message.payload[1]))
                                : 1000);
            break;
        }
    }

    if (session_lost) {
        std::cout << "❌ " << tag << " " << turn_error_name(TurnError::SessionNotFound)
                  << ", closing connection" << std::endl;
    }

    // Tear down the session first so a turn still in flight finalizes silently
    conn.close();
    store_.destroy_session(session_id);
    orchestrator.shutdown();
    std::cout << "🛑 " << tag << " WebSocket connection closed, " << store_.session_count()
              << " active session(s)" << std::endl;
}
