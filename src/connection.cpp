#include "connection.hpp"

#include <algorithm>
#include <cstring>

#include "errors.hpp"

Connection::Connection(std::chrono::milliseconds io_timeout)
: socket_(io_), io_timeout_(io_timeout)
{
}

Connection::~Connection(){
    close();
}

bool Connection::run(std::chrono::milliseconds timeout){
    io_.restart();
    io_.run_for(timeout);
    if(!io_.stopped()){
        // Closing the socket makes the outstanding operation complete with
        // operation_aborted; run again so its handler executes.
        std::error_code ignored;
        socket_.close(ignored);
        io_.run();
        return false;
    }
    return true;
}

void Connection::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout){
    peer_label_ = host + ":" + std::to_string(port);
    tcp::resolver resolver(io_);
    std::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if(ec){
        throw NetworkError("resolve " + peer_label_ + " failed: " + ec.message());
    }

    ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&ec](const std::error_code& result, const tcp::endpoint&){ ec = result; });
    if(!run(timeout)){
        throw NetworkError("connect to " + peer_label_ + " timed out");
    }
    if(ec){
        throw NetworkError("connect to " + peer_label_ + " failed: " + ec.message());
    }
}

void Connection::write(const char* data, std::size_t size){
    std::error_code ec = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data, size),
        [&ec](const std::error_code& result, std::size_t){ ec = result; });
    if(!run(io_timeout_)){
        throw NetworkError("write to " + remote_address() + " timed out");
    }
    if(ec){
        throw NetworkError("write to " + remote_address() + " failed: " + ec.message());
    }
}

void Connection::write_line(const std::string& line){
    std::string framed = line + "\n";
    write(framed.data(), framed.size());
}

std::string Connection::read_line(std::size_t max_length){
    std::error_code ec = asio::error::would_block;
    std::size_t n = 0;
    asio::async_read_until(socket_, asio::dynamic_buffer(pending_, max_length), '\n',
        [&](const std::error_code& result, std::size_t length){
            ec = result;
            n = length;
        });
    if(!run(io_timeout_)){
        throw NetworkError("read from " + remote_address() + " timed out");
    }
    if(ec == asio::error::not_found){
        throw ProtocolError("line from " + remote_address() + " exceeds " + std::to_string(max_length) + " bytes");
    }
    if(ec){
        throw NetworkError("read from " + remote_address() + " failed: " + ec.message());
    }

    std::string line = pending_.substr(0, n - 1);
    pending_.erase(0, n);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::size_t Connection::read_some(char* data, std::size_t size){
    if(size == 0) return 0;
    if(!pending_.empty()){
        std::size_t n = std::min(size, pending_.size());
        std::memcpy(data, pending_.data(), n);
        pending_.erase(0, n);
        return n;
    }

    std::error_code ec = asio::error::would_block;
    std::size_t n = 0;
    socket_.async_read_some(asio::buffer(data, size),
        [&](const std::error_code& result, std::size_t length){
            ec = result;
            n = length;
        });
    if(!run(io_timeout_)){
        throw NetworkError("read from " + remote_address() + " timed out");
    }
    if(ec == asio::error::eof) return n;
    if(ec){
        throw NetworkError("read from " + remote_address() + " failed: " + ec.message());
    }
    return n;
}

void Connection::read_exact(char* data, std::size_t size){
    std::size_t total = 0;
    while(total < size){
        std::size_t n = read_some(data + total, size - total);
        if(n == 0){
            throw NetworkError("connection from " + remote_address() + " closed after " +
                               std::to_string(total) + " of " + std::to_string(size) + " bytes");
        }
        total += n;
    }
}

std::string Connection::remote_address() const {
    if(!peer_label_.empty()) return peer_label_;
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(ec) return "<unknown>";
    peer_label_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    return peer_label_;
}

std::string Connection::remote_host() const {
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(ec) return "";
    return ep.address().to_string();
}

void Connection::close(){
    std::error_code ignored;
    if(socket_.is_open()){
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}
