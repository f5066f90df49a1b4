#include "PieceManager.hpp"
#include "../utils/Log.hpp"
#include "../utils/SHA1.hpp"
#include <algorithm>
#include <mutex>

PieceManager::PieceManager(const MetaInfo& meta, PieceStorage& storage, uint32_t block_size)
    : piece_hashes(meta.pieceHashes()), piece_length(meta.pieceLength()), total_length(meta.totalLength()),
      block_size(block_size),
      storage(storage), pieces(meta.pieceCount()), availability(meta.pieceCount(), 0) {
    progress.bytes_total = meta.totalLength();
    progress.completed.assign(pieces.size(), false);

    for (size_t i = 0; i < pieces.size(); i++) {
        size_t block_count = static_cast<size_t>((pieceSize(i) + block_size - 1) / block_size);
        pieces[i].blocks.resize(block_count);
    }
}

int64_t PieceManager::pieceSize(size_t index) const {
    if (index + 1 < pieces.size()) {
        return piece_length;
    }
    return total_length - piece_length * static_cast<int64_t>(index);
}

uint32_t PieceManager::blockLength(size_t index, size_t block) const {
    int64_t remaining = pieceSize(index) - static_cast<int64_t>(block) * block_size;
    return static_cast<uint32_t>(std::min<int64_t>(remaining, block_size));
}

void PieceManager::addPeer(const std::string& peer) {
    std::unique_lock lock(state_mutex);
    peer_pieces.try_emplace(peer, std::vector<bool>(pieces.size(), false));
}

bool PieceManager::peerBitfield(const std::string& peer, const std::vector<bool>& has) {
    std::unique_lock lock(state_mutex);
    auto& known = peer_pieces[peer];
    known.resize(pieces.size(), false);

    for (size_t i = 0; i < pieces.size(); i++) {
        bool now = i < has.size() && has[i];
        if (known[i] != now) {
            availability[i] += now ? 1 : -1;
            known[i] = now;
        }
    }
    return interestingLocked(known);
}

bool PieceManager::peerHave(const std::string& peer, uint32_t index) {
    std::unique_lock lock(state_mutex);
    auto& known = peer_pieces[peer];
    known.resize(pieces.size(), false);

    if (index < pieces.size() && !known[index]) {
        known[index] = true;
        availability[index]++;
    }
    return interestingLocked(known);
}

bool PieceManager::isInteresting(const std::string& peer) const {
    std::shared_lock lock(state_mutex);
    auto it = peer_pieces.find(peer);
    return it != peer_pieces.end() && interestingLocked(it->second);
}

bool PieceManager::interestingLocked(const std::vector<bool>& has) const {
    for (size_t i = 0; i < pieces.size(); i++) {
        if (has[i] && pieces[i].state != PieceState::Complete) {
            return true;
        }
    }
    return false;
}

void PieceManager::removePeer(const std::string& peer) {
    releaseRequests(peer);

    std::unique_lock lock(state_mutex);
    auto it = peer_pieces.find(peer);
    if (it == peer_pieces.end()) {
        return;
    }
    for (size_t i = 0; i < pieces.size(); i++) {
        if (it->second[i]) {
            availability[i]--;
        }
    }
    peer_pieces.erase(it);
}

size_t PieceManager::releaseRequests(const std::string& peer) {
    std::unique_lock lock(state_mutex);
    size_t released = 0;
    for (size_t i = 0; i < pieces.size(); i++) {
        Piece& piece = pieces[i];
        if (piece.state != PieceState::InFlight) {
            continue;
        }

        bool any_outstanding = false;
        for (auto& block : piece.blocks) {
            // The peer name stays on the slot so its late delivery is still recognised
            if (block.state == BlockState::Requested && block.peer == peer) {
                block.state = BlockState::Missing;
                released++;
            }
            any_outstanding = any_outstanding || block.state != BlockState::Missing;
        }
        // Nothing received or pending any more: the piece is simply missing again
        if (!any_outstanding) {
            resetPiece(i);
        }
    }
    if (released > 0) {
        Log::debug("Returned ", released, " requested blocks of ", peer, " to the pool");
    }
    return released;
}

std::optional<BlockRequest> PieceManager::nextRequest(const std::string& peer) {
    std::unique_lock lock(state_mutex);
    auto it = peer_pieces.find(peer);
    if (it == peer_pieces.end()) {
        return std::nullopt;
    }
    const auto& has = it->second;

    // Finish pieces already in flight before opening new ones
    for (size_t i = 0; i < pieces.size(); i++) {
        if (has[i] && pieces[i].state == PieceState::InFlight) {
            if (auto request = assignBlock(i, peer)) {
                return request;
            }
        }
    }

    // Rarest first, lowest index on ties
    std::optional<size_t> rarest;
    for (size_t i = 0; i < pieces.size(); i++) {
        if (has[i] && pieces[i].state == PieceState::Missing) {
            if (!rarest || availability[i] < availability[*rarest]) {
                rarest = i;
            }
        }
    }
    if (!rarest) {
        return std::nullopt;
    }

    Piece& piece = pieces[*rarest];
    piece.state = PieceState::InFlight;
    piece.data.assign(static_cast<size_t>(pieceSize(*rarest)), 0);
    piece.received = 0;
    return assignBlock(*rarest, peer);
}

std::optional<BlockRequest> PieceManager::assignBlock(size_t index, const std::string& peer) {
    Piece& piece = pieces[index];
    for (size_t b = 0; b < piece.blocks.size(); b++) {
        Block& block = piece.blocks[b];
        if (block.state == BlockState::Missing) {
            block.state = BlockState::Requested;
            block.peer = peer;
            return BlockRequest{
                .index = static_cast<uint32_t>(index),
                .begin = static_cast<uint32_t>(b * block_size),
                .length = blockLength(index, b)
            };
        }
    }
    return std::nullopt;
}

BlockResult PieceManager::receiveBlock(const std::string& peer, const BlockData& block) {
    std::vector<uint8_t> piece_data;
    size_t index = block.index;
    {
        std::unique_lock lock(state_mutex);
        if (index >= pieces.size() || block.begin % block_size != 0) {
            return BlockResult::Unexpected;
        }
        Piece& piece = pieces[index];
        size_t b = block.begin / block_size;
        if (piece.state != PieceState::InFlight || b >= piece.blocks.size() ||
            block.data.size() != blockLength(index, b)) {
            return BlockResult::Unexpected;
        }

        Block& slot = piece.blocks[b];
        bool requested_here = slot.state == BlockState::Requested && slot.peer == peer;
        // A block released after a choke may still arrive from the peer it was asked of
        bool late_delivery = slot.state == BlockState::Missing && slot.peer == peer;
        if (!requested_here && !late_delivery) {
            return BlockResult::Unexpected;
        }

        std::copy(block.data.begin(), block.data.end(), piece.data.begin() + block.begin);
        slot.state = BlockState::Received;
        slot.peer = peer;
        piece.received++;

        if (piece.received < piece.blocks.size()) {
            return BlockResult::Accepted;
        }
        piece.state = PieceState::Verifying;
        piece_data = std::move(piece.data);
        piece.data.clear();
    }

    // Verify and persist outside lock
    BlockResult result = BlockResult::PieceComplete;
    if (SHA1::calculate(piece_data) != piece_hashes[index]) {
        Log::warn("Piece ", index, " failed hash check, discarding");
        result = BlockResult::HashMismatch;
    } else {
        try {
            storage.writePiece(index, piece_length * static_cast<int64_t>(index), piece_data);
        } catch (const std::exception& e) {
            Log::error("Failed to write piece ", index, ": ", e.what());
            result = BlockResult::WriteFailed;
        }
    }

    std::unique_lock lock(state_mutex);
    if (result == BlockResult::PieceComplete) {
        Piece& piece = pieces[index];
        piece.state = PieceState::Complete;
        piece.blocks.clear();
        progress.completed[index] = true;
        progress.bytes_downloaded += static_cast<int64_t>(piece_data.size());
        Log::debug("Piece ", index, " verified (", progress.bytes_downloaded, "/", progress.bytes_total, " bytes)");
    } else {
        resetPiece(index);
    }
    return result;
}

void PieceManager::resetPiece(size_t index) {
    Piece& piece = pieces[index];
    piece.state = PieceState::Missing;
    for (auto& block : piece.blocks) {
        block = Block{};
    }
    piece.data.clear();
    piece.data.shrink_to_fit();
    piece.received = 0;
}

bool PieceManager::finished() const {
    std::shared_lock lock(state_mutex);
    return progress.finished();
}

DownloadProgress PieceManager::snapshot() const {
    std::shared_lock lock(state_mutex);
    return progress;
}

std::vector<bool> PieceManager::completedPieces() const {
    std::shared_lock lock(state_mutex);
    return progress.completed;
}

PieceState PieceManager::pieceState(size_t index) const {
    std::shared_lock lock(state_mutex);
    return pieces.at(index).state;
}

size_t PieceManager::outstandingRequests(const std::string& peer) const {
    std::shared_lock lock(state_mutex);
    size_t count = 0;
    for (const auto& piece : pieces) {
        for (const auto& block : piece.blocks) {
            if (block.state == BlockState::Requested && block.peer == peer) {
                count++;
            }
        }
    }
    return count;
}

void PieceManager::addUploaded(int64_t bytes) {
    std::unique_lock lock(state_mutex);
    progress.bytes_uploaded += bytes;
}
