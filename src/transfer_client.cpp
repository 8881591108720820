#include "transfer_client.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "connection.hpp"
#include "content_hasher.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "staging_file.hpp"

namespace {
constexpr std::size_t kListingReadSize = 64 * 1024;
constexpr std::size_t kMaxResponseLine = 64;
}

TransferClient::TransferClient(std::filesystem::path directory,
                               Options options,
                               std::shared_ptr<Logger> logger,
                               ActiveFlag* active)
    : directory_(std::move(directory)),
      options_(options),
      logger_(std::move(logger)),
      active_(active)
{
}

TransferClient::Stats TransferClient::stats() const {
    Stats s;
    s.listings = listings_.load();
    s.pushes = pushes_.load();
    s.pulls = pulls_.load();
    s.chunk_requests = chunk_requests_.load();
    s.bytes_sent = bytes_sent_.load();
    s.bytes_received = bytes_received_.load();
    return s;
}

void TransferClient::check_active() const {
    if(active_ && !active_->active()) throw NetworkError("node is shutting down");
}

std::unique_ptr<Connection> TransferClient::open(const PeerAddress& peer){
    check_active();
    auto conn = std::make_unique<Connection>(options_.io_timeout);
    conn->connect(peer.host, peer.port, options_.connect_timeout);
    return conn;
}

FileMap TransferClient::fetch_listing(const PeerAddress& peer){
    auto conn = open(peer);
    conn->write_line(format_list_request());

    auto header = conn->read_line(kMaxResponseLine);
    if(header.empty() || header.size() > 20 ||
       !std::all_of(header.begin(), header.end(), [](unsigned char ch){ return std::isdigit(ch); })){
        throw ProtocolError("bad listing header from " + peer.str() + ": '" + header + "'");
    }
    uint64_t length = 0;
    try {
        length = std::stoull(header);
    } catch(const std::out_of_range&) {
        throw ProtocolError("listing length out of range from " + peer.str());
    }

    // Grow with the data actually received rather than trusting the header.
    std::string body;
    std::vector<char> buffer(kListingReadSize);
    while(body.size() < length){
        auto want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), length - body.size()));
        auto n = conn->read_some(buffer.data(), want);
        if(n == 0){
            throw NetworkError("listing from " + peer.str() + " truncated at " +
                               std::to_string(body.size()) + " of " + std::to_string(length) + " bytes");
        }
        body.append(buffer.data(), n);
    }
    bytes_received_ += body.size();

    auto files = decode_listing(body);
    ++listings_;
    log_debug(logger_.get(), "Listing from {}: {} file(s)", peer.str(), files.size());
    return files;
}

void TransferClient::push(const PeerAddress& peer, const std::string& filename){
    auto path = directory_ / filename;
    std::error_code ec;
    const uint64_t size = std::filesystem::file_size(path, ec);
    if(ec){
        throw FilesystemError("cannot stat " + filename + ": " + ec.message());
    }
    std::ifstream in(path, std::ios::binary);
    if(!in){
        throw FilesystemError("cannot open " + filename);
    }

    auto conn = open(peer);
    conn->write_line(format_prepare_request(filename, size));
    auto response = conn->read_line(kMaxRequestLine);
    if(response != kReadyToken){
        throw ProtocolError(peer.str() + " refused " + filename + ": " + response);
    }

    std::vector<char> buffer(std::max<std::size_t>(1, options_.block_size));
    uint64_t sent = 0;
    while(sent < size){
        check_active();
        auto want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), size - sent));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        auto n = in.gcount();
        if(n <= 0){
            // closing here makes the receiver discard its staging file
            throw FilesystemError(filename + " shrank while sending (" + std::to_string(sent) +
                                  " of " + std::to_string(size) + " bytes)");
        }
        conn->write(buffer.data(), static_cast<std::size_t>(n));
        sent += static_cast<uint64_t>(n);
    }
    bytes_sent_ += sent;

    auto ack = conn->read_line(kMaxRequestLine);
    if(ack != kDoneToken){
        throw ProtocolError(peer.str() + " did not confirm " + filename + ": " + ack);
    }
    ++pushes_;
    log_info(logger_.get(), "Pushed {} ({} bytes) to {}", filename, size, peer.str());
}

std::vector<char> TransferClient::fetch_block(const PeerAddress& peer,
                                              const std::string& filename,
                                              uint64_t block_index,
                                              uint64_t expected_length){
    auto conn = open(peer);
    ++chunk_requests_;
    conn->write_line(format_chunk_request(filename, block_index));

    // one spare byte so an oversized answer is detected instead of truncated
    std::vector<char> block(static_cast<std::size_t>(expected_length) + 1);
    std::size_t total = 0;
    for(;;){
        auto n = conn->read_some(block.data() + total, block.size() - total);
        if(n == 0) break;
        total += n;
        if(total > expected_length){
            throw ProtocolError("block " + std::to_string(block_index) + " of " + filename +
                                " from " + peer.str() + " is longer than " +
                                std::to_string(expected_length) + " bytes (block size mismatch?)");
        }
    }
    if(total < expected_length){
        throw ProtocolError("short block " + std::to_string(block_index) + " of " + filename +
                            " from " + peer.str() + ": " + std::to_string(total) + " of " +
                            std::to_string(expected_length) + " bytes");
    }
    block.resize(total);
    bytes_received_ += total;
    return block;
}

void TransferClient::pull(const PeerAddress& peer,
                          const std::string& filename,
                          uint64_t size,
                          const std::string& expected_hash){
    if(auto reason = name_rejection_reason(filename)){
        throw ProtocolError("refusing to pull '" + filename + "': " + *reason);
    }

    StagingFile staging(directory_, filename, logger_);
    const uint64_t block_size = options_.block_size;
    const uint64_t blocks = block_count(size, block_size);
    for(uint64_t index = 0; index < blocks; ++index){
        auto data = fetch_block(peer, filename, index, block_length(size, block_size, index));
        staging.write_at(index * block_size, data.data(), data.size());
    }
    staging.flush();

    if(!expected_hash.empty()){
        auto actual = hash_file(staging.path(), options_.block_size);
        if(actual != expected_hash){
            throw ProtocolError("hash mismatch for " + filename + " from " + peer.str() +
                                " (expected " + expected_hash + ", got " + actual + ")");
        }
    }

    staging.commit();
    ++pulls_;
    log_info(logger_.get(), "Pulled {} ({} bytes, {} block(s)) from {}", filename, size, blocks, peer.str());
}
