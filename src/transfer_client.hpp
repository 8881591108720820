#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "active_flag.hpp"
#include "file_index.hpp"
#include "log.hpp"
#include "peer_registry.hpp"

class Connection;

// Initiator side of the peer protocol. Each call opens its own connection(s);
// failures are thrown as NetworkError / ProtocolError / FilesystemError.
class TransferClient {
public:
    struct Options {
        std::size_t block_size = 1 << 20;
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds io_timeout{15000};
    };

    struct Stats {
        uint64_t listings = 0;
        uint64_t pushes = 0;
        uint64_t pulls = 0;
        uint64_t chunk_requests = 0;
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
    };

    TransferClient(std::filesystem::path directory,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr,
                   ActiveFlag* active = nullptr);

    FileMap fetch_listing(const PeerAddress& peer);

    // PREPARE, wait for READY, stream the file, wait for DONE.
    void push(const PeerAddress& peer, const std::string& filename);

    // One CHUNK request per block into a staging file. When expected_hash is
    // given the assembled bytes must hash to it before the file is installed.
    void pull(const PeerAddress& peer,
              const std::string& filename,
              uint64_t size,
              const std::string& expected_hash = "");

    Stats stats() const;
    const Options& options() const { return options_; }

private:
    std::unique_ptr<Connection> open(const PeerAddress& peer);
    std::vector<char> fetch_block(const PeerAddress& peer,
                                  const std::string& filename,
                                  uint64_t block_index,
                                  uint64_t expected_length);
    void check_active() const;

    std::filesystem::path directory_;
    Options options_;
    std::shared_ptr<Logger> logger_;
    ActiveFlag* active_;

    std::atomic<uint64_t> listings_{0};
    std::atomic<uint64_t> pushes_{0};
    std::atomic<uint64_t> pulls_{0};
    std::atomic<uint64_t> chunk_requests_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_received_{0};
};
