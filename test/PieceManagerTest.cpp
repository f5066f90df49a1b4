#include "manager/PieceManager.hpp"
#include "utils/Errors.hpp"
#include "utils/SHA1.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace {

class MemoryStorage : public PieceStorage {
public:
    void writePiece(size_t index, int64_t offset, const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (fail_writes) {
            throw StorageError("disk full");
        }
        writes[index]++;
        if (bytes.size() < static_cast<size_t>(offset) + data.size()) {
            bytes.resize(static_cast<size_t>(offset) + data.size());
        }
        std::copy(data.begin(), data.end(), bytes.begin() + offset);
    }

    std::mutex mutex;
    std::map<size_t, int> writes;
    std::vector<uint8_t> bytes;
    bool fail_writes = false;
};

constexpr uint32_t BLOCK = 4;

// 3 pieces of 8 bytes plus a 5-byte tail piece, 4-byte blocks
MetaInfo makeMeta(const std::vector<uint8_t>& payload, int64_t piece_length) {
    SingleFileInfo info;
    info.name = "payload.bin";
    info.piece_length = piece_length;
    info.length = static_cast<int64_t>(payload.size());
    for (size_t start = 0; start < payload.size(); start += piece_length) {
        size_t end = std::min(payload.size(), start + static_cast<size_t>(piece_length));
        info.piece_hashes.push_back(SHA1::calculate(std::vector<uint8_t>(payload.begin() + start, payload.begin() + end)));
    }
    MetaInfo meta;
    meta.info = info;
    return meta;
}

}

class PieceManagerTest : public ::testing::Test {
protected:
    std::vector<uint8_t> payload;
    MetaInfo meta;
    MemoryStorage storage;

    void SetUp() override {
        payload.resize(29);
        for (size_t i = 0; i < payload.size(); i++) {
            payload[i] = static_cast<uint8_t>(i * 7 + 1);
        }
        meta = makeMeta(payload, 8);
    }

    BlockData blockFor(const BlockRequest& request) const {
        auto start = payload.begin() + static_cast<int64_t>(request.index) * 8 + request.begin;
        return BlockData{request.index, request.begin, std::vector<uint8_t>(start, start + request.length)};
    }

    // Requests and delivers blocks for `peer` until it has nothing left to fetch
    void drain(PieceManager& pieces, const std::string& peer) {
        while (auto request = pieces.nextRequest(peer)) {
            pieces.receiveBlock(peer, blockFor(*request));
        }
    }
};

TEST_F(PieceManagerTest, SplitsPiecesIntoBlocks) {
    PieceManager pieces(meta, storage, BLOCK);
    EXPECT_EQ(pieces.pieceCount(), 4u);
    EXPECT_EQ(pieces.pieceSize(3), 5);

    pieces.peerBitfield("a", {false, false, false, true});
    auto first = pieces.nextRequest("a");
    auto second = pieces.nextRequest("a");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, (BlockRequest{3, 0, 4}));
    EXPECT_EQ(*second, (BlockRequest{3, 4, 1}));
    EXPECT_FALSE(pieces.nextRequest("a"));
    EXPECT_EQ(pieces.pieceState(3), PieceState::InFlight);
}

TEST_F(PieceManagerTest, FinishesOnlyWhenEveryPieceVerified) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, true, true, true});

    int verified = 0;
    while (auto request = pieces.nextRequest("a")) {
        EXPECT_FALSE(pieces.finished());
        if (pieces.receiveBlock("a", blockFor(*request)) == BlockResult::PieceComplete) {
            verified++;
        }
    }
    EXPECT_EQ(verified, 4);
    EXPECT_TRUE(pieces.finished());

    DownloadProgress progress = pieces.snapshot();
    EXPECT_EQ(progress.bytes_downloaded, 29);
    EXPECT_EQ(progress.bytesLeft(), 0);
    EXPECT_EQ(storage.bytes, payload);
    for (size_t i = 0; i < 4; i++) {
        EXPECT_EQ(storage.writes[i], 1);
    }
}

TEST_F(PieceManagerTest, CorruptedBlockResetsPiece) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, false, false, false});

    auto first = pieces.nextRequest("a");
    auto second = pieces.nextRequest("a");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(pieces.receiveBlock("a", blockFor(*first)), BlockResult::Accepted);

    BlockData bad = blockFor(*second);
    bad.data[0] ^= 0xFF;
    EXPECT_EQ(pieces.receiveBlock("a", bad), BlockResult::HashMismatch);

    EXPECT_EQ(pieces.pieceState(0), PieceState::Missing);
    EXPECT_EQ(pieces.snapshot().bytes_downloaded, 0);
    EXPECT_TRUE(storage.writes.empty());
    EXPECT_FALSE(pieces.completedPieces()[0]);

    // The piece is requested again from scratch
    auto retry = pieces.nextRequest("a");
    ASSERT_TRUE(retry);
    EXPECT_EQ(*retry, (BlockRequest{0, 0, 4}));
}

TEST_F(PieceManagerTest, WriteFailureResetsPiece) {
    storage.fail_writes = true;
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, false, false, false});

    BlockResult last = BlockResult::Accepted;
    while (auto request = pieces.nextRequest("a")) {
        last = pieces.receiveBlock("a", blockFor(*request));
        if (last != BlockResult::Accepted) {
            break;
        }
    }
    EXPECT_EQ(last, BlockResult::WriteFailed);
    EXPECT_EQ(pieces.pieceState(0), PieceState::Missing);
    EXPECT_EQ(pieces.snapshot().bytes_downloaded, 0);
}

TEST_F(PieceManagerTest, RejectsUnrequestedBlocks) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, true, true, true});
    pieces.peerBitfield("b", {true, true, true, true});

    // Piece 1 was never requested
    EXPECT_EQ(pieces.receiveBlock("a", blockFor({1, 0, 4})), BlockResult::Unexpected);

    auto request = pieces.nextRequest("a");
    ASSERT_TRUE(request);
    // Requested from a, delivered by b
    EXPECT_EQ(pieces.receiveBlock("b", blockFor(*request)), BlockResult::Unexpected);
    // Wrong length
    BlockData shortBlock = blockFor(*request);
    shortBlock.data.pop_back();
    EXPECT_EQ(pieces.receiveBlock("a", shortBlock), BlockResult::Unexpected);
    EXPECT_EQ(pieces.receiveBlock("a", blockFor(*request)), BlockResult::Accepted);
    // Duplicate
    EXPECT_EQ(pieces.receiveBlock("a", blockFor(*request)), BlockResult::Unexpected);
    // Out of range
    EXPECT_EQ(pieces.receiveBlock("a", BlockData{9, 0, {1, 2, 3, 4}}), BlockResult::Unexpected);
}

TEST_F(PieceManagerTest, SelectsRarestPieceFirst) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, true, true, true});
    pieces.peerBitfield("b", {true, true, false, true});
    pieces.peerBitfield("c", {true, false, false, true});
    // Availability: piece0=3 piece1=2 piece2=1 piece3=3

    auto request = pieces.nextRequest("a");
    ASSERT_TRUE(request);
    EXPECT_EQ(request->index, 2u);

    // Ties break to the lowest index
    pieces.peerHave("c", 1);
    auto from_c = pieces.nextRequest("c");
    ASSERT_TRUE(from_c);
    EXPECT_EQ(from_c->index, 0u);
}

TEST_F(PieceManagerTest, ContinuesInFlightPiecesFirst) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, true, true, true});
    pieces.peerBitfield("b", {true, true, true, true});

    auto from_a = pieces.nextRequest("a");
    ASSERT_TRUE(from_a);
    auto from_b = pieces.nextRequest("b");
    ASSERT_TRUE(from_b);
    EXPECT_EQ(from_b->index, from_a->index);
    EXPECT_NE(from_b->begin, from_a->begin);
}

TEST_F(PieceManagerTest, RemovedPeerReturnsItsBlocks) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, false, false, false});
    pieces.peerBitfield("b", {true, false, false, false});

    auto first = pieces.nextRequest("a");
    auto second = pieces.nextRequest("a");
    ASSERT_TRUE(first && second);
    EXPECT_FALSE(pieces.nextRequest("b"));
    EXPECT_EQ(pieces.receiveBlock("a", blockFor(*first)), BlockResult::Accepted);

    pieces.removePeer("a");
    EXPECT_EQ(pieces.outstandingRequests("a"), 0u);
    EXPECT_EQ(pieces.pieceState(0), PieceState::InFlight);

    // b finishes the piece a started
    auto rest = pieces.nextRequest("b");
    ASSERT_TRUE(rest);
    EXPECT_EQ(*rest, *second);
    EXPECT_EQ(pieces.receiveBlock("b", blockFor(*rest)), BlockResult::PieceComplete);
    EXPECT_EQ(pieces.pieceState(0), PieceState::Complete);
}

TEST_F(PieceManagerTest, ChokeReleasesRequestsButAcceptsLateBlocks) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, false, false, false});

    auto first = pieces.nextRequest("a");
    auto second = pieces.nextRequest("a");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(pieces.receiveBlock("a", blockFor(*first)), BlockResult::Accepted);

    EXPECT_EQ(pieces.releaseRequests("a"), 1u);
    EXPECT_EQ(pieces.outstandingRequests("a"), 0u);
    pieces.peerBitfield("b", {true, false, false, false});
    EXPECT_EQ(pieces.receiveBlock("b", blockFor(*second)), BlockResult::Unexpected);
    EXPECT_EQ(pieces.receiveBlock("a", blockFor(*second)), BlockResult::PieceComplete);
}

TEST_F(PieceManagerTest, ReleasingUntouchedPieceMakesItMissing) {
    PieceManager pieces(meta, storage, BLOCK);
    pieces.peerBitfield("a", {true, false, false, false});
    ASSERT_TRUE(pieces.nextRequest("a"));
    pieces.releaseRequests("a");
    EXPECT_EQ(pieces.pieceState(0), PieceState::Missing);
}

TEST_F(PieceManagerTest, InterestFollowsMissingPieces) {
    PieceManager pieces(meta, storage, BLOCK);
    EXPECT_FALSE(pieces.peerBitfield("a", {false, false, false, false}));
    EXPECT_TRUE(pieces.peerHave("a", 2));
    EXPECT_TRUE(pieces.isInteresting("a"));

    drain(pieces, "a");
    EXPECT_EQ(pieces.pieceState(2), PieceState::Complete);
    EXPECT_FALSE(pieces.isInteresting("a"));
    EXPECT_FALSE(pieces.isInteresting("unknown"));
}

TEST_F(PieceManagerTest, AtMostOneOutstandingRequestPerBlockUnderConcurrency) {
    std::vector<uint8_t> big(64 * 16);
    for (size_t i = 0; i < big.size(); i++) {
        big[i] = static_cast<uint8_t>(i % 251);
    }
    payload = big;
    meta = makeMeta(payload, 64);
    PieceManager pieces(meta, storage, 16);

    std::mutex seen_mutex;
    std::set<std::pair<uint32_t, uint32_t>> outstanding;
    std::atomic<bool> duplicate{false};

    auto peerTask = [&](const std::string& peer) {
        pieces.peerBitfield(peer, std::vector<bool>(pieces.pieceCount(), true));
        while (auto request = pieces.nextRequest(peer)) {
            {
                std::lock_guard<std::mutex> lock(seen_mutex);
                if (!outstanding.insert({request->index, request->begin}).second) {
                    duplicate = true;
                }
            }
            auto start = payload.begin() + static_cast<int64_t>(request->index) * 64 + request->begin;
            std::vector<uint8_t> data(start, start + request->length);
            {
                std::lock_guard<std::mutex> lock(seen_mutex);
                outstanding.erase({request->index, request->begin});
            }
            pieces.receiveBlock(peer, BlockData{request->index, request->begin, std::move(data)});
        }
        pieces.removePeer(peer);
    };

    std::vector<std::thread> peers;
    for (int i = 0; i < 8; i++) {
        peers.emplace_back(peerTask, "peer" + std::to_string(i));
    }
    for (auto& thread : peers) {
        thread.join();
    }

    EXPECT_FALSE(duplicate);
    EXPECT_TRUE(pieces.finished());
    EXPECT_EQ(storage.bytes, payload);
    for (const auto& [index, count] : storage.writes) {
        EXPECT_EQ(count, 1) << "piece " << index;
    }
}

TEST_F(PieceManagerTest, EmptyPayloadIsFinishedImmediately) {
    payload.clear();
    meta = makeMeta(payload, 8);
    PieceManager pieces(meta, storage, BLOCK);
    EXPECT_TRUE(pieces.finished());
    EXPECT_FALSE(pieces.nextRequest("a"));
}
