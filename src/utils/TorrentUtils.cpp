#include "TorrentUtils.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

bool TorrentUtils::isUrlSafe(unsigned char byte) {
    return (byte >= '0' && byte <= '9') || (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') ||
           byte == '-' || byte == '_' || byte == '.' || byte == '~';
}

std::string TorrentUtils::urlEncode(std::string_view data) {
    std::stringstream ss;
    for (char c : data) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (isUrlSafe(byte)) {
            ss << c;
        } else {
            ss << "%" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
               << static_cast<int>(byte);
        }
    }
    return ss.str();
}

std::string TorrentUtils::readTorrentFile(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open torrent file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}
