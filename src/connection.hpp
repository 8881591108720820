#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <string>

// One blocking TCP exchange with a peer. Every operation is bounded: the
// socket runs on a private io_context driven with run_for(), and an operation
// that does not finish in time closes the socket and throws NetworkError.
class Connection {
public:
    using tcp = asio::ip::tcp;

    explicit Connection(std::chrono::milliseconds io_timeout);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Outgoing side.
    void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    // Incoming side: the acceptor accepts straight into this socket.
    tcp::socket& socket() { return socket_; }

    void write(const char* data, std::size_t size);
    void write_line(const std::string& line);

    // Reads through the next '\n' and returns the line without it. Throws
    // ProtocolError if no newline appears within max_length bytes and
    // NetworkError if the peer closes first.
    std::string read_line(std::size_t max_length);

    // Returns 0 once the peer has closed the stream.
    std::size_t read_some(char* data, std::size_t size);
    void read_exact(char* data, std::size_t size);

    std::string remote_address() const;
    std::string remote_host() const; // IP only, "" if unknown
    void close();

private:
    // false if the operation timed out
    bool run(std::chrono::milliseconds timeout);

    asio::io_context io_;
    tcp::socket socket_;
    std::string pending_; // bytes read past the last returned line
    std::chrono::milliseconds io_timeout_;
    mutable std::string peer_label_;
};
