#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "active_flag.hpp"
#include "connection.hpp"
#include "file_index.hpp"
#include "log.hpp"
#include "protocol.hpp"

class PeerRegistry;

// Receive side of one PREPARE push.
struct TransferSession {
    std::string filename;
    uint64_t expected_size = 0;
    uint64_t bytes_transferred = 0;
    std::filesystem::path staging_path;
};

// Accepts peer connections and answers exactly one request per connection
// (LIST, PREPARE or CHUNK) on a thread of its own.
class TransferServer {
public:
    struct Options {
        std::string listen_ip = "0.0.0.0";
        uint16_t port = 5005;             // 0 picks an ephemeral port
        std::size_t block_size = 1 << 20;
        std::chrono::milliseconds io_timeout{15000};
        bool admit_inbound_peers = false;
        uint16_t inbound_peer_port = 5005; // port recorded for admitted inbound hosts
        std::size_t max_connections = 64;  // concurrent handlers; extra connections are closed
    };

    struct Stats {
        uint64_t connections = 0;
        uint64_t connections_refused = 0;
        uint64_t lists_served = 0;
        uint64_t pushes_committed = 0;
        uint64_t pushes_failed = 0;
        uint64_t chunks_served = 0;
    };

    TransferServer(FileIndex& index,
                   ActiveFlag& active,
                   Options options,
                   std::shared_ptr<Logger> logger,
                   PeerRegistry* registry = nullptr);
    ~TransferServer();

    // Binds the listening socket (throws on failure) and starts accepting.
    void start();
    // Waits for the accept loop and all connection threads; the caller clears
    // the ActiveFlag first.
    void stop();

    uint16_t port() const { return bound_port_; }
    Stats stats() const;

private:
    using tcp = asio::ip::tcp;

    void accept_loop();
    // False when the connection could not be given a handler thread.
    bool spawn_worker(std::shared_ptr<Connection> conn);
    void reap_workers_locked();

    void handle_connection(Connection& conn);
    void serve_list(Connection& conn);
    void receive_push(Connection& conn, const Request& req);
    void serve_block(Connection& conn, const Request& req);

    FileIndex& index_;
    ActiveFlag& active_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    PeerRegistry* registry_;

    asio::io_context io_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::thread accept_thread_;
    uint16_t bound_port_ = 0;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_m_;
    std::list<Worker> workers_;

    std::atomic<uint64_t> connections_{0};
    std::atomic<uint64_t> connections_refused_{0};
    std::atomic<uint64_t> lists_served_{0};
    std::atomic<uint64_t> pushes_committed_{0};
    std::atomic<uint64_t> pushes_failed_{0};
    std::atomic<uint64_t> chunks_served_{0};
};
