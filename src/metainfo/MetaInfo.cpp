#include "MetaInfo.hpp"
#include "../bencode/BencodeFields.hpp"
#include "../bencode/BencodeParser.hpp"
#include "../utils/Errors.hpp"
#include "../utils/TorrentUtils.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace {

std::vector<SHA1::Digest> splitPieceHashes(const std::string& pieces) {
    if (pieces.size() % 20 != 0) {
        throw InvalidField("pieces", "length " + std::to_string(pieces.size()) + " is not a multiple of 20");
    }
    std::vector<SHA1::Digest> hashes(pieces.size() / 20);
    for (size_t i = 0; i < hashes.size(); i++) {
        std::copy(pieces.begin() + i * 20, pieces.begin() + (i + 1) * 20, hashes[i].begin());
    }
    return hashes;
}

bool decodePrivate(const nlohmann::json& info) {
    auto value = BencodeFields::optionalInteger(info, "private");
    if (!value) {
        return false;
    }
    if (*value < 0 || *value > 255) {
        throw InvalidField("private", "expected an 8-bit integer");
    }
    return *value == 1;
}

FileEntry decodeFileEntry(const nlohmann::json& value) {
    const auto& dict = BencodeFields::requireDictionary(value, "files");
    BencodeFields::expectOnly(dict, {"length", "path", "md5sum"});

    FileEntry entry;
    entry.length = BencodeFields::requireInteger(dict, "length");
    if (entry.length < 0) {
        throw InvalidField("length", "negative file length");
    }

    const auto& path = BencodeFields::requireList(dict, "path");
    if (path.empty()) {
        throw InvalidField("path", "empty path");
    }
    for (const auto& segment : path) {
        if (!segment.is_string()) {
            throw InvalidField("path", "expected byte string segments");
        }
        entry.path.push_back(segment.get<std::string>());
    }

    entry.md5sum = BencodeFields::optionalString(dict, "md5sum");
    return entry;
}

Info decodeInfo(const nlohmann::json& value) {
    const auto& info = BencodeFields::requireDictionary(value, "info");
    BencodeFields::expectOnly(info, {"name", "piece length", "pieces", "length", "files", "private", "md5sum"});

    std::string name = BencodeFields::requireString(info, "name");
    int64_t piece_length = BencodeFields::requireInteger(info, "piece length");
    if (piece_length <= 0) {
        throw InvalidField("piece length", "must be positive");
    }
    auto piece_hashes = splitPieceHashes(BencodeFields::requireString(info, "pieces"));
    bool is_private = decodePrivate(info);

    bool has_length = info.contains("length");
    bool has_files = info.contains("files");
    if (has_length && has_files) {
        throw InvalidMetainfo("info has both length and files");
    }
    if (!has_length && !has_files) {
        throw InvalidMetainfo("info has neither length nor files");
    }

    int64_t total_length = 0;
    Info result;
    if (has_length) {
        SingleFileInfo single;
        single.name = std::move(name);
        single.piece_length = piece_length;
        single.length = BencodeFields::requireInteger(info, "length");
        if (single.length < 0) {
            throw InvalidField("length", "negative length");
        }
        single.is_private = is_private;
        single.md5sum = BencodeFields::optionalString(info, "md5sum");
        total_length = single.length;
        single.piece_hashes = std::move(piece_hashes);
        result = std::move(single);
    } else {
        if (info.contains("md5sum")) {
            throw UnexpectedField("md5sum");
        }
        MultiFileInfo multi;
        multi.name = std::move(name);
        multi.piece_length = piece_length;
        multi.is_private = is_private;
        const auto& files = BencodeFields::requireList(info, "files");
        if (files.empty()) {
            throw InvalidField("files", "empty file list");
        }
        for (const auto& file : files) {
            multi.files.push_back(decodeFileEntry(file));
            if (multi.files.back().length > std::numeric_limits<int64_t>::max() - total_length) {
                throw InvalidMetainfo("payload length overflows");
            }
            total_length += multi.files.back().length;
        }
        multi.piece_hashes = std::move(piece_hashes);
        result = std::move(multi);
    }

    // Pieces must cover the payload exactly, the last one holding the remainder
    size_t expected_pieces = static_cast<size_t>(total_length / piece_length + (total_length % piece_length != 0));
    size_t actual_pieces = std::visit([](const auto& i) { return i.piece_hashes.size(); }, result);
    if (expected_pieces != actual_pieces) {
        throw InvalidMetainfo("pieces holds " + std::to_string(actual_pieces) + " hashes but " +
                              std::to_string(total_length) + " bytes need " + std::to_string(expected_pieces));
    }
    return result;
}

std::vector<std::string> decodeAnnounceList(const nlohmann::json& value) {
    if (!value.is_array()) {
        throw InvalidField("announce-list", "expected a list of tiers");
    }
    std::vector<std::string> trackers;
    for (const auto& tier : value) {
        if (!tier.is_array()) {
            throw InvalidField("announce-list", "expected a list of tiers");
        }
        for (const auto& url : tier) {
            if (!url.is_string()) {
                throw InvalidField("announce-list", "expected tracker URLs as byte strings");
            }
            trackers.push_back(url.get<std::string>());
        }
    }
    return trackers;
}

std::vector<std::string> decodeUrlList(const nlohmann::json& value) {
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    if (!value.is_array()) {
        throw InvalidField("url-list", "expected a URL or a list of URLs");
    }
    std::vector<std::string> urls;
    for (const auto& url : value) {
        if (!url.is_string()) {
            throw InvalidField("url-list", "expected URLs as byte strings");
        }
        urls.push_back(url.get<std::string>());
    }
    return urls;
}

}

std::string FileEntry::joinedPath() const {
    std::string joined;
    for (const auto& segment : path) {
        if (!joined.empty()) {
            joined += "/";
        }
        joined += segment;
    }
    return joined;
}

MetaInfo MetaInfo::decode(std::string_view torrent_bytes) {
    try {
        BencodeParser parser;
        nlohmann::json root = parser.decode(torrent_bytes);
        BencodeFields::requireDictionary(root, "torrent");

        MetaInfo meta;
        meta.announce = BencodeFields::requireString(root, "announce");
        meta.info = decodeInfo(BencodeFields::require(root, "info"));
        meta.info_hash = InfoHash::fromInfoBytes(parser.rawValue("info"));

        if (root.contains("announce-list")) {
            meta.announce_list = decodeAnnounceList(root["announce-list"]);
        }
        if (root.contains("url-list")) {
            meta.url_list = decodeUrlList(root["url-list"]);
        }
        meta.creation_date = BencodeFields::optionalInteger(root, "creation date");
        meta.comment = BencodeFields::optionalString(root, "comment");
        meta.created_by = BencodeFields::optionalString(root, "created by");
        meta.encoding = BencodeFields::optionalString(root, "encoding");
        return meta;
    } catch (const InvalidMetainfo&) {
        throw;
    } catch (const DecodeError& e) {
        throw InvalidMetainfo(e.what());
    }
}

MetaInfo MetaInfo::fromFile(const std::string& filepath) {
    return decode(TorrentUtils::readTorrentFile(filepath));
}

const std::string& MetaInfo::name() const {
    return std::visit([](const auto& i) -> const std::string& { return i.name; }, info);
}

int64_t MetaInfo::pieceLength() const {
    return std::visit([](const auto& i) { return i.piece_length; }, info);
}

const std::vector<SHA1::Digest>& MetaInfo::pieceHashes() const {
    return std::visit([](const auto& i) -> const std::vector<SHA1::Digest>& { return i.piece_hashes; }, info);
}

int64_t MetaInfo::pieceSize(size_t index) const {
    if (index >= pieceCount()) {
        return 0;
    }
    if (index + 1 < pieceCount()) {
        return pieceLength();
    }
    int64_t remainder = totalLength() - pieceLength() * static_cast<int64_t>(index);
    return remainder;
}

int64_t MetaInfo::totalLength() const {
    if (const auto* single = std::get_if<SingleFileInfo>(&info)) {
        return single->length;
    }
    int64_t total = 0;
    for (const auto& file : std::get<MultiFileInfo>(info).files) {
        total += file.length;
    }
    return total;
}

bool MetaInfo::isPrivate() const {
    return std::visit([](const auto& i) { return i.is_private; }, info);
}

std::vector<FileEntry> MetaInfo::files() const {
    if (const auto* single = std::get_if<SingleFileInfo>(&info)) {
        return {FileEntry{single->length, {single->name}, single->md5sum}};
    }
    return std::get<MultiFileInfo>(info).files;
}

std::vector<std::string> MetaInfo::trackers() const {
    std::vector<std::string> result;
    auto add = [&result](const std::string& url) {
        if (!url.empty() && std::find(result.begin(), result.end(), url) == result.end()) {
            result.push_back(url);
        }
    };
    add(announce);
    for (const auto& url : announce_list) {
        add(url);
    }
    return result;
}

std::string MetaInfo::describe(bool verbose) const {
    std::ostringstream ss;
    ss << "Tracker URL: " << announce << "\n";
    if (!announce_list.empty()) {
        ss << "Announce list:\n";
        for (const auto& url : announce_list) {
            ss << "    " << url << "\n";
        }
    }
    if (creation_date) {
        std::time_t created = static_cast<std::time_t>(*creation_date);
        std::tm tm{};
        gmtime_r(&created, &tm);
        ss << "Creation date: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
    }
    if (comment) {
        ss << "Comment: " << *comment << "\n";
    }
    if (created_by) {
        ss << "Created by: " << *created_by << "\n";
    }
    if (encoding) {
        ss << "Encoding: " << *encoding << "\n";
    }
    if (!url_list.empty()) {
        ss << "Web seeds:\n";
        for (const auto& url : url_list) {
            ss << "    " << url << "\n";
        }
    }
    ss << "Info Hash: " << info_hash.toHex() << "\n";
    ss << "Length: " << totalLength() << "\n";
    ss << "Piece Length: " << pieceLength() << "\n";
    ss << "Pieces: " << pieceCount() << "\n";

    if (verbose) {
        ss << "Name: " << name() << "\n";
        ss << "Private: " << (isPrivate() ? "yes" : "no") << "\n";
        if (isMultiFile()) {
            ss << "Files:\n";
            for (const auto& file : files()) {
                ss << "    " << file.joinedPath() << " (" << file.length << " bytes";
                if (file.md5sum) {
                    ss << ", md5sum " << *file.md5sum;
                }
                ss << ")\n";
            }
        }
        ss << "Piece Hashes:\n";
        for (const auto& hash : pieceHashes()) {
            ss << "    " << SHA1::toHex(hash) << "\n";
        }
    }
    return ss.str();
}
