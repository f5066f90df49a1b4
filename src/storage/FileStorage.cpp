#include "FileStorage.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Log.hpp"
#include <algorithm>
#include <fstream>

namespace {
void checkSegment(const std::string& segment) {
    if (segment.empty() || segment == "." || segment == ".." ||
        segment.find('/') != std::string::npos || segment.find('\0') != std::string::npos) {
        throw StorageError("Unsafe path segment in torrent: '" + segment + "'");
    }
}
}

FileStorage::FileStorage(const MetaInfo& meta, const std::filesystem::path& download_dir) {
    checkSegment(meta.name());

    std::filesystem::path base = download_dir;
    if (meta.isMultiFile()) {
        base /= meta.name();
    }
    root = meta.isMultiFile() ? base : download_dir / meta.name();

    int64_t offset = 0;
    for (const auto& entry : meta.files()) {
        std::filesystem::path path = base;
        for (const auto& segment : entry.path) {
            checkSegment(segment);
            path /= segment;
        }
        paths.push_back(path);
        files.push_back(File{offset, entry.length});
        offset += entry.length;
    }

    try {
        for (const auto& path : paths) {
            std::filesystem::create_directories(path.parent_path());
            if (!std::filesystem::exists(path)) {
                std::ofstream create(path, std::ios::binary);
                if (!create) {
                    throw StorageError("Cannot create " + path.string());
                }
            }
            Log::debug("Output file ", path.string());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw StorageError(e.what());
    }
}

std::vector<FileStorage::Slice> FileStorage::locate(int64_t offset, int64_t length) const {
    std::vector<Slice> slices;
    int64_t end = offset + length;
    for (size_t i = 0; i < files.size() && offset < end; i++) {
        int64_t file_end = files[i].offset + files[i].length;
        if (file_end <= offset || files[i].length == 0) {
            continue;
        }
        int64_t slice_length = std::min(end, file_end) - offset;
        slices.push_back(Slice{i, offset - files[i].offset, slice_length});
        offset += slice_length;
    }
    if (offset < end) {
        throw StorageError("Byte range past end of torrent payload");
    }
    return slices;
}

void FileStorage::writePiece(size_t index, int64_t offset, const std::vector<uint8_t>& data) {
    auto slices = locate(offset, static_cast<int64_t>(data.size()));

    std::lock_guard<std::mutex> lock(write_mutex);
    size_t written = 0;
    for (const auto& slice : slices) {
        std::fstream file(paths[slice.file_index], std::ios::in | std::ios::out | std::ios::binary);
        if (!file) {
            throw StorageError("Cannot open " + paths[slice.file_index].string());
        }
        file.seekp(slice.file_offset);
        if (!file.write(reinterpret_cast<const char*>(data.data() + written), slice.length)) {
            throw StorageError("Failed to write piece " + std::to_string(index) + " to " +
                               paths[slice.file_index].string());
        }
        written += static_cast<size_t>(slice.length);
    }
}
