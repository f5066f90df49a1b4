#pragma once
#include "../metainfo/MetaInfo.hpp"
#include "../protocol/PeerMessage.hpp"
#include "../storage/PieceStorage.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct DownloadProgress {
    int64_t bytes_total = 0;
    int64_t bytes_downloaded = 0;
    int64_t bytes_uploaded = 0;
    std::vector<bool> completed;

    bool finished() const { return bytes_downloaded == bytes_total; }
    int64_t bytesLeft() const { return bytes_total - bytes_downloaded; }
};

enum class PieceState { Missing, InFlight, Verifying, Complete };

enum class BlockResult {
    Accepted,       // stored, piece still incomplete
    PieceComplete,  // last block in, piece verified and written
    HashMismatch,   // last block in, digest wrong; piece reset to Missing
    WriteFailed,    // verified but storage failed; piece reset to Missing
    Unexpected,     // not requested from this peer, wrong length or already done
};

// Single source of truth for piece and block state across all peer tasks.
// Peers are identified by their "ip:port" address.
class PieceManager {
public:
    PieceManager(const MetaInfo& meta, PieceStorage& storage, uint32_t block_size = 16 * 1024);

    // Peer availability; the bool results tell whether the peer has a piece we still need
    void addPeer(const std::string& peer);
    bool peerBitfield(const std::string& peer, const std::vector<bool>& pieces);
    bool peerHave(const std::string& peer, uint32_t index);
    bool isInteresting(const std::string& peer) const;

    // Returns the peer's outstanding blocks to Missing and forgets its pieces
    void removePeer(const std::string& peer);
    // Returns the peer's outstanding blocks to Missing (after a choke)
    size_t releaseRequests(const std::string& peer);

    // Picks the next block for this peer and marks it requested, or nullopt
    // when the peer holds nothing that isn't already complete or in flight
    std::optional<BlockRequest> nextRequest(const std::string& peer);
    BlockResult receiveBlock(const std::string& peer, const BlockData& block);

    bool finished() const;
    DownloadProgress snapshot() const;
    std::vector<bool> completedPieces() const;
    PieceState pieceState(size_t index) const;
    size_t outstandingRequests(const std::string& peer) const;
    void addUploaded(int64_t bytes);

    size_t pieceCount() const { return piece_hashes.size(); }
    int64_t pieceSize(size_t index) const;
    uint32_t blockSize() const { return block_size; }

private:
    enum class BlockState { Missing, Requested, Received };

    struct Block {
        BlockState state = BlockState::Missing;
        std::string peer;
    };

    struct Piece {
        PieceState state = PieceState::Missing;
        std::vector<Block> blocks;
        std::vector<uint8_t> data;
        size_t received = 0;
    };

    uint32_t blockLength(size_t index, size_t block) const;
    std::optional<BlockRequest> assignBlock(size_t index, const std::string& peer);
    void resetPiece(size_t index);
    bool interestingLocked(const std::vector<bool>& has) const;

    const std::vector<SHA1::Digest> piece_hashes;
    const int64_t piece_length;
    const int64_t total_length;
    const uint32_t block_size;
    PieceStorage& storage;

    mutable std::shared_mutex state_mutex;
    std::vector<Piece> pieces;
    std::vector<int> availability;
    std::map<std::string, std::vector<bool>> peer_pieces;
    DownloadProgress progress;
};
