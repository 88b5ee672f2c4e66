/**
 * @file types.h
 * @brief Opaque identifiers shared by every trustledger module
 *
 * - Principal: 20-byte account identifier. The all-zero value is reserved.
 * - CiphertextHandle: 32-byte opaque reference to an encrypted value held by
 *   the executor arena. The all-zero value is the "no data yet" sentinel.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_CORE_TYPES_H
#define TRUSTLEDGER_CORE_TYPES_H

#include "trustledger/core/common.h"

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

namespace trustledger {

using ByteVec = std::vector<uint8_t>;

/** Seconds since the Unix epoch, as supplied by the host environment */
using Timestamp = uint64_t;

/**
 * @brief Encrypted value type, stored in byte 30 of every handle
 */
enum class ValueType : uint8_t {
    Bool = 0,
    Uint32 = 4
};

const char* value_type_name(ValueType type);

// ============================================================================
// Principal
// ============================================================================

class Principal {
public:
    using Bytes = std::array<uint8_t, TRUSTLEDGER_PRINCIPAL_SIZE>;

    Principal() : bytes_{} {}
    explicit Principal(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Build from raw bytes
     * @throws std::invalid_argument if len != TRUSTLEDGER_PRINCIPAL_SIZE
     */
    static Principal from_bytes(const uint8_t* data, size_t len);

    /**
     * @brief Parse "0x"-prefixed or bare 40-digit hex
     * @throws std::invalid_argument on malformed input
     */
    static Principal from_hex(const std::string& hex);

    /** The reserved all-zero principal */
    static Principal zero() { return Principal(); }

    bool is_zero() const;
    const Bytes& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    std::string to_hex() const;

    bool operator==(const Principal& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Principal& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Principal& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

// ============================================================================
// Ciphertext handle
// ============================================================================

class CiphertextHandle {
public:
    using Bytes = std::array<uint8_t, TRUSTLEDGER_HANDLE_SIZE>;

    CiphertextHandle() : bytes_{} {}
    explicit CiphertextHandle(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Build a handle from a digest prefix and a value type
     * @param digest At least TRUSTLEDGER_HANDLE_DIGEST_SIZE bytes
     */
    static CiphertextHandle make(const uint8_t* digest, ValueType type);

    static CiphertextHandle from_bytes(const uint8_t* data, size_t len);
    static CiphertextHandle from_hex(const std::string& hex);

    /** The empty sentinel returned for users with no data yet */
    static CiphertextHandle empty() { return CiphertextHandle(); }

    bool is_empty() const;
    ValueType type() const { return static_cast<ValueType>(bytes_[30]); }
    uint8_t version() const { return bytes_[31]; }

    const Bytes& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    std::string to_hex() const;

    bool operator==(const CiphertextHandle& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const CiphertextHandle& other) const { return bytes_ != other.bytes_; }
    bool operator<(const CiphertextHandle& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

namespace internal {

inline size_t hash_prefix(const uint8_t* data) {
    size_t h = 0;
    std::memcpy(&h, data, sizeof(h));
    return h;
}

} // namespace internal

struct PrincipalHash {
    size_t operator()(const Principal& p) const noexcept {
        return internal::hash_prefix(p.data());
    }
};

struct HandleHash {
    size_t operator()(const CiphertextHandle& h) const noexcept {
        return internal::hash_prefix(h.data());
    }
};

} // namespace trustledger

#endif // TRUSTLEDGER_CORE_TYPES_H
