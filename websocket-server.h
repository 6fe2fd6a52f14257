#pragma once

#include "client-events.h"
#include "websocket-frame.h"
#include "session-store.h"
#include "turn-orchestrator.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

// One accepted WebSocket. Sends from the turn thread, the synthesis delivery
// thread and the reader thread are serialized here.
class WebSocketConnection : public ClientChannel {
public:
    explicit WebSocketConnection(int fd);
    ~WebSocketConnection() override;

    bool send_text(const std::string& message) override;
    bool send_binary(const std::string& payload) override;
    bool send_pong(const std::string& payload);
    bool send_close(uint16_t code, const std::string& reason = "");

    // Shuts the socket down; pending and later sends fail
    void close();
    bool is_open() const { return open_.load(); }

private:
    bool send_frame(const std::string& frame);

    int fd_;
    std::atomic<bool> open_;
    std::mutex send_mutex_;
};

struct ServerConfig {
    int port = 8000;
    std::string path = "/ws";
    std::chrono::seconds session_timeout{3600};
    std::chrono::seconds eviction_interval{60};
    OrchestratorConfig orchestrator;
    bool verbose = false;
};

// Accepts WebSocket connections and runs one session per connection
class VoiceChatServer {
public:
    VoiceChatServer(const ServerConfig& config, const Collaborators& collaborators);
    ~VoiceChatServer();

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    size_t active_sessions() const { return store_.session_count(); }

private:
    void server_loop();
    void handle_client(int client_socket);
    void serve_session(int client_socket, WebSocketConnection& conn, FrameReader& reader);
    void eviction_loop();

    ServerConfig config_;
    Collaborators collaborators_;
    SessionStore store_;

    int server_socket_;
    std::atomic<bool> running_;
    std::thread server_thread_;
    std::thread eviction_thread_;
    std::mutex eviction_mutex_;
    std::condition_variable eviction_cv_;

    // Client sockets with a live handler thread
    std::set<int> client_sockets_;
    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
};
