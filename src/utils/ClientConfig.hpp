#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>

struct ClientConfig {
    uint16_t listen_port = 6881;
    std::filesystem::path download_dir = ".";
    bool verbose = false;

    // Tracker scheduling
    std::chrono::milliseconds announce_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds retry_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds tracker_timeout{std::chrono::seconds(15)};

    // Peer wire
    uint32_t block_size = 16 * 1024;
    int pipeline_depth = 5;
    int max_peers = 30;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds peer_idle_timeout{std::chrono::seconds(120)};
    std::chrono::milliseconds keepalive_interval{std::chrono::seconds(100)};
    // Longest wait for a piece while requests are outstanding
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
};
