#include "transfer_server.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "peer_registry.hpp"
#include "staging_file.hpp"

namespace {
constexpr std::chrono::milliseconds kAcceptPoll{250};
}

TransferServer::TransferServer(FileIndex& index,
                               ActiveFlag& active,
                               Options options,
                               std::shared_ptr<Logger> logger,
                               PeerRegistry* registry)
: index_(index),
  active_(active),
  options_(std::move(options)),
  logger_(std::move(logger)),
  registry_(registry)
{
}

TransferServer::~TransferServer(){
    stop();
}

void TransferServer::start(){
    if(acceptor_) return;

    asio::ip::address listen_address;
    try {
        listen_address = asio::ip::make_address(options_.listen_ip);
    } catch(const std::exception& e) {
        log_error(logger_.get(), "Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
        throw;
    }

    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(listen_address, options_.port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    log_info(logger_.get(), "Transfer server listening on {}:{}", options_.listen_ip, bound_port_);
    accept_thread_ = std::thread([this](){ accept_loop(); });
}

void TransferServer::stop(){
    if(accept_thread_.joinable()) accept_thread_.join();

    std::list<Worker> remaining;
    {
        std::lock_guard lg(workers_m_);
        remaining.swap(workers_);
    }
    for(auto& worker : remaining){
        if(worker.thread.joinable()) worker.thread.join();
    }

    if(acceptor_){
        std::error_code ignored;
        acceptor_->close(ignored);
        acceptor_.reset();
    }
}

TransferServer::Stats TransferServer::stats() const {
    Stats s;
    s.connections = connections_.load();
    s.connections_refused = connections_refused_.load();
    s.lists_served = lists_served_.load();
    s.pushes_committed = pushes_committed_.load();
    s.pushes_failed = pushes_failed_.load();
    s.chunks_served = chunks_served_.load();
    return s;
}

void TransferServer::accept_loop(){
    while(active_.active()){
        auto conn = std::make_shared<Connection>(options_.io_timeout);
        std::error_code accept_ec = asio::error::would_block;
        acceptor_->async_accept(conn->socket(),
            [&accept_ec](const std::error_code& ec){ accept_ec = ec; });

        io_.restart();
        io_.run_for(kAcceptPoll);
        if(!io_.stopped()){
            // nobody connected within the poll window; cancel and re-check the flag
            std::error_code ignored;
            acceptor_->cancel(ignored);
            io_.restart();
            io_.run();
        }

        if(accept_ec == asio::error::operation_aborted || accept_ec == asio::error::would_block){
            continue;
        }
        if(accept_ec){
            log_error(logger_.get(), "Accept error: {}", accept_ec.message());
            active_.sleep_for(kAcceptPoll);
            continue;
        }

        ++connections_;
        log_debug(logger_.get(), "Accepted connection from {}", conn->remote_address());
        if(!spawn_worker(conn)){
            ++connections_refused_;
            conn->close();
            active_.sleep_for(kAcceptPoll);
        }
    }
    log_debug(logger_.get(), "Accept loop finished");
}

bool TransferServer::spawn_worker(std::shared_ptr<Connection> conn){
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lg(workers_m_);
    reap_workers_locked();
    if(workers_.size() >= options_.max_connections){
        log_warn(logger_.get(), "Refusing connection from {}: {} handlers busy",
                 conn->remote_address(), workers_.size());
        return false;
    }
    Worker worker;
    worker.done = done;
    try {
        worker.thread = std::thread([this, conn, done](){
            handle_connection(*conn);
            conn->close();
            done->store(true);
        });
    } catch(const std::system_error& e){
        log_error(logger_.get(), "Cannot start handler for {}: {}", conn->remote_address(), e.what());
        return false;
    }
    workers_.push_back(std::move(worker));
    return true;
}

void TransferServer::reap_workers_locked(){
    for(auto it = workers_.begin(); it != workers_.end();){
        if(it->done->load()){
            if(it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferServer::handle_connection(Connection& conn){
    if(options_.admit_inbound_peers && registry_){
        auto host = conn.remote_host();
        if(!host.empty()){
            registry_->admit(PeerAddress{host, options_.inbound_peer_port});
        }
    }

    std::string line;
    try {
        line = conn.read_line(kMaxRequestLine);
        log_debug(logger_.get(), "Request from {}: {}", conn.remote_address(), line);
        Request req = parse_request(line);
        switch(req.verb){
            case Request::Verb::List:    serve_list(conn); break;
            case Request::Verb::Prepare: receive_push(conn, req); break;
            case Request::Verb::Chunk:   serve_block(conn, req); break;
        }
    } catch(const ProtocolError& e){
        log_warn(logger_.get(), "Bad request from {}: {}", conn.remote_address(), e.what());
        // CHUNK answers are raw bytes, so only a PREPARE gets an error token
        if(line.rfind("PREPARE", 0) == 0){
            try {
                conn.write_line(std::string(kErrorPrefix) + e.what());
            } catch(const std::exception& write_error){
                log_debug(logger_.get(), "Unable to report error: {}", write_error.what());
            }
        }
    } catch(const std::exception& e){
        log_warn(logger_.get(), "Connection with {} failed: {}", conn.remote_address(), e.what());
    }
}

void TransferServer::serve_list(Connection& conn){
    auto files = index_.snapshot();
    auto body = encode_listing(files);
    conn.write_line(std::to_string(body.size()));
    conn.write(body.data(), body.size());
    ++lists_served_;
    log_info(logger_.get(), "Sent listing of {} file(s) to {}", files.size(), conn.remote_address());
}

void TransferServer::receive_push(Connection& conn, const Request& req){
    TransferSession session;
    session.filename = req.filename;
    session.expected_size = req.size;

    try {
        std::unique_ptr<StagingFile> staging;
        try {
            staging = std::make_unique<StagingFile>(index_.directory(), req.filename, logger_);
        } catch(const FilesystemError&){
            conn.write_line(std::string(kErrorPrefix) + "cannot stage " + req.filename);
            throw;
        }
        session.staging_path = staging->path();

        conn.write_line(kReadyToken);
        log_info(logger_.get(), "Receiving {} ({} bytes) from {}",
                 session.filename, session.expected_size, conn.remote_address());

        const std::size_t buffer_size = static_cast<std::size_t>(
            std::max<uint64_t>(1, std::min<uint64_t>(options_.block_size, session.expected_size)));
        std::vector<char> buffer(buffer_size);
        while(session.bytes_transferred < session.expected_size){
            if(!active_.active()) throw NetworkError("shutting down");
            auto want = static_cast<std::size_t>(
                std::min<uint64_t>(buffer.size(), session.expected_size - session.bytes_transferred));
            auto n = conn.read_some(buffer.data(), want);
            if(n == 0){
                throw NetworkError("sender closed after " + std::to_string(session.bytes_transferred) +
                                   " of " + std::to_string(session.expected_size) + " bytes");
            }
            staging->append(buffer.data(), n);
            session.bytes_transferred += n;
        }

        staging->commit();
        index_.invalidate();
        ++pushes_committed_;
        log_info(logger_.get(), "Received {} ({} bytes)", session.filename, session.bytes_transferred);
    } catch(...){
        ++pushes_failed_;
        log_warn(logger_.get(), "Discarded partial {} ({} of {} bytes)",
                 session.filename, session.bytes_transferred, session.expected_size);
        throw;
    }

    conn.write_line(kDoneToken);
}

void TransferServer::serve_block(Connection& conn, const Request& req){
    ++chunks_served_;
    const uint64_t block_size = options_.block_size;
    const auto max_offset = static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max());
    if(req.block_index > max_offset / block_size) return;

    std::ifstream in(index_.directory() / req.filename, std::ios::binary);
    if(!in){
        log_debug(logger_.get(), "CHUNK for missing file {}", req.filename);
        return;
    }
    in.seekg(static_cast<std::streamoff>(req.block_index * block_size));
    if(!in) return; // past end of file

    std::vector<char> buffer(block_size);
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto n = in.gcount();
    if(n <= 0) return;
    conn.write(buffer.data(), static_cast<std::size_t>(n));
    log_debug(logger_.get(), "Sent block {} of {} ({} bytes) to {}",
              req.block_index, req.filename, n, conn.remote_address());
}
