#pragma once
#include "PieceStorage.hpp"
#include "../metainfo/MetaInfo.hpp"
#include <filesystem>
#include <mutex>
#include <vector>

// Lays a torrent out on disk: <dir>/<name> for a single file,
// <dir>/<name>/<path...> for multi-file torrents. Piece bytes are split
// across files in declared order.
class FileStorage : public PieceStorage {
public:
    struct Slice {
        size_t file_index;
        int64_t file_offset;
        int64_t length;
    };

    // Creates directories and files (without truncating existing ones).
    // Throws StorageError on unsafe paths or filesystem errors.
    FileStorage(const MetaInfo& meta, const std::filesystem::path& download_dir);

    void writePiece(size_t index, int64_t offset, const std::vector<uint8_t>& data) override;

    // File ranges covering [offset, offset + length) of the payload
    std::vector<Slice> locate(int64_t offset, int64_t length) const;

    const std::vector<std::filesystem::path>& filePaths() const { return paths; }
    const std::filesystem::path& rootPath() const { return root; }

private:
    struct File {
        int64_t offset;
        int64_t length;
    };

    std::filesystem::path root;
    std::vector<std::filesystem::path> paths;
    std::vector<File> files;
    std::mutex write_mutex;
};
