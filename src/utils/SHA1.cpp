#include "SHA1.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

SHA1::Digest SHA1::calculate(std::string_view input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("Failed to allocate SHA-1 context");
    }

    Digest hash;
    unsigned int length = 0;
    if (EVP_DigestInit_ex(context.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash.data(), &length) != 1 || length != hash.size()) {
        throw std::runtime_error("SHA-1 computation failed");
    }
    return hash;
}

SHA1::Digest SHA1::calculate(const std::vector<uint8_t>& input) {
    return calculate(std::string_view(reinterpret_cast<const char*>(input.data()), input.size()));
}

std::string SHA1::toHex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}
