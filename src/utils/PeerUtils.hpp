#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../protocol/PeerMessage.hpp"

class StopSignal;

// Owns a connected TCP socket and moves whole peer-wire frames over it.
// Blocking waits are split into short poll slices so a stop request is
// noticed at every suspension point.
class PeerUtils {
public:
    static constexpr uint32_t MAX_MESSAGE_LENGTH = 1 << 18;
    static constexpr std::chrono::milliseconds POLL_SLICE{100};

    PeerUtils(int socket_fd, const StopSignal* stop);
    ~PeerUtils();

    PeerUtils(const PeerUtils&) = delete;
    PeerUtils& operator=(const PeerUtils&) = delete;

    // Throws PeerError: InvalidAddress for a bad IPv4 literal or port,
    // SocketUnavailable when the socket can't be created or connected.
    static int connectTo(const std::string& ip, int port, std::chrono::milliseconds timeout,
                         const StopSignal* stop);
    static std::pair<std::string, int> parsePeerAddress(const std::string& peer_addr);
    static std::pair<std::string, int> parsePeerAddress(const std::string& peers_data, size_t offset);

    void sendAll(const std::vector<uint8_t>& data);
    void recvExact(uint8_t* buffer, size_t length, std::chrono::milliseconds timeout);

    // Waits up to `wait` for a frame to start. Returns nullopt when none did;
    // once a frame started, the rest must arrive within `timeout`.
    std::optional<PeerMessage> receiveMessage(std::chrono::milliseconds wait, std::chrono::milliseconds timeout);
    void sendMessage(const PeerMessage& message);

    static void addIntToPayload(std::vector<uint8_t>& payload, uint32_t value, size_t offset);
    static uint32_t readIntFromPayload(const std::vector<uint8_t>& payload, size_t offset);

private:
    // Returns true when the socket became readable within timeout
    bool waitReadable(std::chrono::milliseconds timeout);

    int sock;
    const StopSignal* stop;
};
