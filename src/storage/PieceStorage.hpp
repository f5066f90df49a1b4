#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Destination for verified pieces. Implementations must accept writes from
// several threads at once.
class PieceStorage {
public:
    virtual ~PieceStorage() = default;

    // offset is the piece's position in the concatenated payload.
    // Throws StorageError when the bytes could not be written.
    virtual void writePiece(size_t index, int64_t offset, const std::vector<uint8_t>& data) = 0;
};
