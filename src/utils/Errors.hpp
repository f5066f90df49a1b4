#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// Decode failures: malformed bencode or a typed decoder rejecting a field.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MalformedEncoding : public DecodeError {
public:
    MalformedEncoding(size_t offset, const std::string& reason)
        : DecodeError("Malformed bencode at offset " + std::to_string(offset) + ": " + reason),
          offset(offset) {}

    size_t getOffset() const { return offset; }

private:
    size_t offset;
};

class MissingField : public DecodeError {
public:
    explicit MissingField(const std::string& key)
        : DecodeError("Missing field: " + key), key(key) {}

    const std::string& getKey() const { return key; }

private:
    std::string key;
};

class UnexpectedField : public DecodeError {
public:
    explicit UnexpectedField(const std::string& key)
        : DecodeError("Unexpected field: " + key), key(key) {}

    const std::string& getKey() const { return key; }

private:
    std::string key;
};

class InvalidField : public DecodeError {
public:
    InvalidField(const std::string& key, const std::string& reason)
        : DecodeError("Invalid field " + key + ": " + reason), key(key) {}

    const std::string& getKey() const { return key; }

private:
    std::string key;
};

class InvalidMetainfo : public DecodeError {
public:
    explicit InvalidMetainfo(const std::string& reason)
        : DecodeError("Invalid metainfo: " + reason) {}
};

// Recoverable at task level: the owning tracker loop retries, the peer task closes.
class NetworkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TrackerError : public NetworkError {
public:
    explicit TrackerError(const std::string& reason)
        : NetworkError("Tracker error: " + reason) {}
};

// The tracker answered with a "failure reason".
class TrackerFailure : public TrackerError {
public:
    explicit TrackerFailure(const std::string& failure_reason)
        : TrackerError("announce failed: " + failure_reason), failure_reason(failure_reason) {}

    const std::string& getFailureReason() const { return failure_reason; }

private:
    std::string failure_reason;
};

class PeerError : public NetworkError {
public:
    enum Kind { InvalidAddress, SocketUnavailable, ProtocolViolation, Other };

    PeerError(Kind kind, const std::string& reason)
        : NetworkError(reason), kind(kind) {}

    Kind getKind() const { return kind; }

private:
    Kind kind;
};

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown at a suspension point once the swarm is stopping.
class Cancelled : public std::runtime_error {
public:
    Cancelled() : std::runtime_error("Cancelled") {}
};
