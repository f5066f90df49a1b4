#include "PeerUtils.hpp"
#include "../manager/TaskGroup.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {
std::string systemError(const std::string& what) {
    return what + ": " + std::strerror(errno);
}
}

PeerUtils::PeerUtils(int socket_fd, const StopSignal* stop) : sock(socket_fd), stop(stop) {
}

PeerUtils::~PeerUtils() {
    if (sock >= 0) {
        close(sock);
    }
}

int PeerUtils::connectTo(const std::string& ip, int port, std::chrono::milliseconds timeout,
                         const StopSignal* stop) {
    struct sockaddr_in peer_addr;
    std::memset(&peer_addr, 0, sizeof(peer_addr));
    peer_addr.sin_family = AF_INET;
    if (port <= 0 || port > 65535) {
        throw PeerError(PeerError::InvalidAddress, "Invalid port " + std::to_string(port));
    }
    peer_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, ip.c_str(), &peer_addr.sin_addr) <= 0) {
        throw PeerError(PeerError::InvalidAddress, "Invalid IP address " + ip);
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        throw PeerError(PeerError::SocketUnavailable, systemError("Failed to create socket"));
    }

    // Connect without blocking so the attempt can be bounded and cancelled
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        close(sock);
        throw PeerError(PeerError::Other, systemError("Failed to configure socket"));
    }

    if (::connect(sock, reinterpret_cast<struct sockaddr*>(&peer_addr), sizeof(peer_addr)) < 0) {
        if (errno != EINPROGRESS) {
            std::string reason = systemError("Failed to connect to " + ip + ":" + std::to_string(port));
            close(sock);
            throw PeerError(PeerError::SocketUnavailable, reason);
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (stop && stop->stopRequested()) {
                close(sock);
                throw Cancelled();
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                close(sock);
                throw PeerError(PeerError::SocketUnavailable, "Connection to " + ip + ":" + std::to_string(port) + " timed out");
            }

            struct pollfd pfd = {sock, POLLOUT, 0};
            int ready = poll(&pfd, 1, static_cast<int>(POLL_SLICE.count()));
            if (ready < 0 && errno != EINTR) {
                std::string reason = systemError("Failed to wait for connection");
                close(sock);
                throw PeerError(PeerError::SocketUnavailable, reason);
            }
            if (ready > 0) {
                break;
            }
        }

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            close(sock);
            throw PeerError(PeerError::SocketUnavailable, "Failed to connect to " + ip + ":" +
                            std::to_string(port) + ": " + std::strerror(error));
        }
    }

    // Back to blocking; a stalled peer fails sends instead of hanging the task
    struct timeval send_timeout = {30, 0};
    if (fcntl(sock, F_SETFL, flags) < 0 ||
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout)) < 0) {
        close(sock);
        throw PeerError(PeerError::Other, systemError("Failed to configure socket"));
    }
    return sock;
}

std::pair<std::string, int> PeerUtils::parsePeerAddress(const std::string& peer_addr) {
    size_t colon = peer_addr.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == peer_addr.size()) {
        throw PeerError(PeerError::InvalidAddress, "Invalid peer address: " + peer_addr);
    }

    int port = 0;
    for (size_t i = colon + 1; i < peer_addr.size(); i++) {
        char c = peer_addr[i];
        if (c < '0' || c > '9' || port > 65535) {
            throw PeerError(PeerError::InvalidAddress, "Invalid peer port: " + peer_addr);
        }
        port = port * 10 + (c - '0');
    }
    if (port == 0 || port > 65535) {
        throw PeerError(PeerError::InvalidAddress, "Invalid peer port: " + peer_addr);
    }
    return {peer_addr.substr(0, colon), port};
}

std::pair<std::string, int> PeerUtils::parsePeerAddress(const std::string& peers_data, size_t offset) {
    if (offset + 6 > peers_data.size()) {
        throw PeerError(PeerError::InvalidAddress, "Truncated compact peer entry");
    }
    const auto* bytes = reinterpret_cast<const unsigned char*>(peers_data.data() + offset);

    // 4 bytes IPv4 then 2 bytes port, both big-endian
    std::string ip = std::to_string(bytes[0]) + "." + std::to_string(bytes[1]) + "." +
                     std::to_string(bytes[2]) + "." + std::to_string(bytes[3]);
    int port = (bytes[4] << 8) | bytes[5];
    return {ip, port};
}

void PeerUtils::sendAll(const std::vector<uint8_t>& data) {
    size_t total_sent = 0;
    while (total_sent < data.size()) {
        ssize_t sent = send(sock, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw PeerError(PeerError::SocketUnavailable, systemError("Failed to send"));
        }
        total_sent += static_cast<size_t>(sent);
    }
}

bool PeerUtils::waitReadable(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (stop && stop->stopRequested()) {
            throw Cancelled();
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        struct pollfd pfd = {sock, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(std::min(remaining, POLL_SLICE).count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw PeerError(PeerError::SocketUnavailable, systemError("Failed to poll socket"));
        }
        if (ready > 0) {
            return true;
        }
    }
}

void PeerUtils::recvExact(uint8_t* buffer, size_t length, std::chrono::milliseconds timeout) {
    size_t total_received = 0;
    while (total_received < length) {
        if (!waitReadable(timeout)) {
            throw PeerError(PeerError::SocketUnavailable, "Timed out waiting for peer data");
        }

        ssize_t received = recv(sock, buffer + total_received, length - total_received, 0);
        if (received == 0) {
            throw PeerError(PeerError::SocketUnavailable, "Connection closed by peer");
        }
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw PeerError(PeerError::SocketUnavailable, systemError("Failed to receive"));
        }
        total_received += static_cast<size_t>(received);
    }
}

std::optional<PeerMessage> PeerUtils::receiveMessage(std::chrono::milliseconds wait, std::chrono::milliseconds timeout) {
    if (!waitReadable(wait)) {
        return std::nullopt;
    }

    std::vector<uint8_t> length_buf(4);
    recvExact(length_buf.data(), length_buf.size(), timeout);
    uint32_t msg_length = readIntFromPayload(length_buf, 0);

    if (msg_length > MAX_MESSAGE_LENGTH) {
        throw PeerError(PeerError::ProtocolViolation, "Message length too large: " + std::to_string(msg_length));
    }

    std::vector<uint8_t> body(msg_length);
    if (msg_length > 0) {
        recvExact(body.data(), body.size(), timeout);
    }
    return PeerMessage::parse(std::move(body));
}

void PeerUtils::sendMessage(const PeerMessage& message) {
    sendAll(message.serialize());
}

void PeerUtils::addIntToPayload(std::vector<uint8_t>& payload, uint32_t value, size_t offset) {
    payload[offset] = (value >> 24) & 0xFF;
    payload[offset + 1] = (value >> 16) & 0xFF;
    payload[offset + 2] = (value >> 8) & 0xFF;
    payload[offset + 3] = value & 0xFF;
}

uint32_t PeerUtils::readIntFromPayload(const std::vector<uint8_t>& payload, size_t offset) {
    return (static_cast<uint32_t>(payload[offset]) << 24) |
           (static_cast<uint32_t>(payload[offset + 1]) << 16) |
           (static_cast<uint32_t>(payload[offset + 2]) << 8) |
           static_cast<uint32_t>(payload[offset + 3]);
}
