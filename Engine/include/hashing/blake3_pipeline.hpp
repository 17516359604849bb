/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content fingerprints for word records
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace Lexigraph {

/**
 * @brief BLAKE3 hashing for content-addressed deduplication.
 *
 * SAME CONTENT = SAME HASH = STORED ONCE
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash an ordered list of fields.
     *
     * Every field is prefixed with its 8-byte little-endian length, so
     * {"ab", "c"} and {"a", "bc"} hash differently.
     */
    static Hash hash_fields(const std::vector<std::string>& fields);

    /**
     * @brief Convert hash to lowercase hex string (32 characters)
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Convert hex string to hash
     * @throws std::invalid_argument on wrong length or non-hex characters
     */
    static Hash from_hex(const std::string& hex);
};

/**
 * @brief Hash functor for unordered containers keyed by BLAKE3Pipeline::Hash.
 */
struct HashHasher {
    size_t operator()(const BLAKE3Pipeline::Hash& h) const {
        size_t out = 0;
        std::memcpy(&out, h.data(), sizeof(out) < h.size() ? sizeof(out) : h.size());
        return out;
    }
};

} // namespace Lexigraph
