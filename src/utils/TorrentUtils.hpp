#pragma once
#include <string>
#include <string_view>

class TorrentUtils {
public:
    // Percent-encodes raw bytes (info_hash, peer_id). RFC 3986 unreserved bytes
    // pass through, every other byte becomes %XX with uppercase hex digits.
    static std::string urlEncode(std::string_view data);
    static bool isUrlSafe(unsigned char byte);

    static std::string readTorrentFile(const std::string& filepath);
};
