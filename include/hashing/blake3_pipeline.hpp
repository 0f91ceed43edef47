/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing primitives for structural digests and fingerprints
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Twinscan {

/**
 * @brief BLAKE3 hashing front-end
 *
 * Every digest in the similarity core goes through here:
 * Merkle node hashes, signature hashes, cache keys and shingle projections.
 * SAME INPUT = SAME DIGEST, on every platform and every run.
 */
class TWINSCAN_API BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Incremental hasher for multi-part inputs (Merkle nodes, cache keys)
     */
    class Hasher {
    public:
        Hasher() { blake3_hasher_init(&state_); }

        Hasher& update(const void* data, size_t len) {
            blake3_hasher_update(&state_, data, len);
            return *this;
        }

        Hasher& update(std::string_view str) {
            return update(str.data(), str.size());
        }

        Hasher& update(const Hash& hash) {
            return update(hash.data(), hash.size());
        }

        Hasher& update_u8(uint8_t tag) {
            return update(&tag, 1);
        }

        // Little-endian, fixed width regardless of host
        Hasher& update_u64(uint64_t value) {
            uint8_t bytes[8];
            for (int i = 0; i < 8; ++i) bytes[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
            return update(bytes, 8);
        }

        Hash finalize() const {
            Hash result;
            blake3_hasher_finalize(&state_, result.data(), HASH_SIZE);
            return result;
        }

        void finalize_into(uint8_t* out, size_t out_len) const {
            blake3_hasher_finalize(&state_, out, out_len);
        }

    private:
        blake3_hasher state_;
    };

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
     * @brief Convert hash to hex string
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace Twinscan
