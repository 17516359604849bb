/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Lexigraph {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_fields(const std::vector<std::string>& fields) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (const auto& field : fields) {
        uint64_t len = field.size();
        uint8_t prefix[8];
        for (int i = 0; i < 8; ++i) {
            prefix[i] = static_cast<uint8_t>((len >> (i * 8)) & 0xFF);
        }
        blake3_hasher_update(&hasher, prefix, sizeof(prefix));
        blake3_hasher_update(&hasher, field.data(), field.size());
    }
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    Hash result = {0};

    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) + ". Expected 32 (128-bit).");
    }
    if (!std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid hex string: " + hex);
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        std::string byte_str = hex.substr(i * 2, 2);
        result[i] = static_cast<uint8_t>(std::stoul(byte_str, nullptr, 16));
    }

    return result;
}

} // namespace Lexigraph
