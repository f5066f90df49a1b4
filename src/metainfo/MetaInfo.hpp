#pragma once
#include "../protocol/Identifiers.hpp"
#include "../utils/SHA1.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct FileEntry {
    int64_t length = 0;
    std::vector<std::string> path;
    std::optional<std::string> md5sum;

    std::string joinedPath() const;
};

struct SingleFileInfo {
    std::string name;
    int64_t piece_length = 0;
    std::vector<SHA1::Digest> piece_hashes;
    int64_t length = 0;
    bool is_private = false;
    std::optional<std::string> md5sum;
};

struct MultiFileInfo {
    std::string name;
    int64_t piece_length = 0;
    std::vector<SHA1::Digest> piece_hashes;
    bool is_private = false;
    std::vector<FileEntry> files;
};

using Info = std::variant<SingleFileInfo, MultiFileInfo>;

// Decoded torrent descriptor. Read-only once decoded.
struct MetaInfo {
    std::string announce;
    // announce-list tiers flattened in tier order
    std::vector<std::string> announce_list;
    Info info;
    std::optional<int64_t> creation_date;
    std::optional<std::string> comment;
    std::optional<std::string> created_by;
    std::optional<std::string> encoding;
    // Web seeds (url-list)
    std::vector<std::string> url_list;
    InfoHash info_hash;

    // Throws InvalidMetainfo naming the offending key
    static MetaInfo decode(std::string_view torrent_bytes);
    static MetaInfo fromFile(const std::string& filepath);

    const std::string& name() const;
    int64_t pieceLength() const;
    const std::vector<SHA1::Digest>& pieceHashes() const;
    size_t pieceCount() const { return pieceHashes().size(); }
    int64_t pieceSize(size_t index) const;
    int64_t totalLength() const;
    bool isPrivate() const;
    bool isMultiFile() const { return std::holds_alternative<MultiFileInfo>(info); }

    // Single-file torrents are presented as one entry named after the torrent
    std::vector<FileEntry> files() const;

    // announce followed by announce-list, duplicates removed
    std::vector<std::string> trackers() const;

    std::string describe(bool verbose) const;
};
