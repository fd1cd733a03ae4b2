#include "crypto/hasher.hpp"
#include "common/error.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>
#include <cctype>

namespace Hasher {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };

hash_t sha256(const uint8_t* data, size_t size) {
    hash_t hash;
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());

    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash.data(), &len)) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    return hash;
}

hash_t sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::optional<hash_t> try_hex_to_hash(const std::string& hex_str) {
    if (hex_str.size() != HASH_SIZE * 2) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    hash_t hash;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        int hi = nibble(hex_str[i * 2]);
        int lo = nibble(hex_str[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        hash[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return hash;
}

hash_t hex_to_hash(const std::string& hex_str) {
    auto hash = try_hex_to_hash(hex_str);
    if (!hash) {
        throw KnapsackError(ErrorKind::InvalidMetadata, "hex_to_hash", "not a 64-character hex digest: '" + hex_str + "'");
    }
    return *hash;
}

std::string hash_to_hex(const hash_t& hash) {
    std::stringstream ss;
    for (uint8_t byte : hash) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return ss.str();
}

std::string short_hex(const hash_t& hash) {
    return hash_to_hex(hash).substr(0, 8);
}

} // namespace Hasher
