/**
 * @file types.cpp
 * @brief Principal and ciphertext handle helpers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/core/types.h"
#include "trustledger/utils/encoding.h"

#include <algorithm>
#include <stdexcept>

namespace trustledger {

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::Bool:
            return "ebool";
        case ValueType::Uint32:
            return "euint32";
        default:
            return "unknown";
    }
}

// ============================================================================
// Principal
// ============================================================================

Principal Principal::from_bytes(const uint8_t* data, size_t len) {
    if (data == nullptr || len != TRUSTLEDGER_PRINCIPAL_SIZE) {
        throw std::invalid_argument("Principal must be 20 bytes");
    }
    Bytes bytes;
    std::copy(data, data + len, bytes.begin());
    return Principal(bytes);
}

Principal Principal::from_hex(const std::string& hex) {
    ByteVec raw = encoding::from_hex(hex);
    return from_bytes(raw.data(), raw.size());
}

bool Principal::is_zero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string Principal::to_hex() const {
    return encoding::to_hex(bytes_.data(), bytes_.size());
}

// ============================================================================
// CiphertextHandle
// ============================================================================

CiphertextHandle CiphertextHandle::make(const uint8_t* digest, ValueType type) {
    if (digest == nullptr) {
        throw std::invalid_argument("Handle digest is null");
    }
    Bytes bytes;
    std::copy(digest, digest + TRUSTLEDGER_HANDLE_DIGEST_SIZE, bytes.begin());
    bytes[30] = static_cast<uint8_t>(type);
    bytes[31] = TRUSTLEDGER_HANDLE_VERSION;
    return CiphertextHandle(bytes);
}

CiphertextHandle CiphertextHandle::from_bytes(const uint8_t* data, size_t len) {
    if (data == nullptr || len != TRUSTLEDGER_HANDLE_SIZE) {
        throw std::invalid_argument("Ciphertext handle must be 32 bytes");
    }
    Bytes bytes;
    std::copy(data, data + len, bytes.begin());
    return CiphertextHandle(bytes);
}

CiphertextHandle CiphertextHandle::from_hex(const std::string& hex) {
    ByteVec raw = encoding::from_hex(hex);
    return from_bytes(raw.data(), raw.size());
}

bool CiphertextHandle::is_empty() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::string CiphertextHandle::to_hex() const {
    return encoding::to_hex(bytes_.data(), bytes_.size());
}

} // namespace trustledger
