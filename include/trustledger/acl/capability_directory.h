/**
 * @file capability_directory.h
 * @brief Per-handle decryption grants
 *
 * A second table beside the ciphertext arena: handle -> set of principals
 * that may request decryption. Grants are append-only.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_ACL_CAPABILITY_DIRECTORY_H
#define TRUSTLEDGER_ACL_CAPABILITY_DIRECTORY_H

#include "trustledger/core/types.h"

#include <set>
#include <unordered_map>
#include <vector>

namespace trustledger {
namespace acl {

/** Principals that receive grants on a freshly produced ciphertext */
using GrantSet = std::vector<Principal>;

class CapabilityDirectory {
public:
    /**
     * @brief Record that principal may decrypt handle (idempotent)
     * @throws std::invalid_argument for the empty handle or the zero principal
     */
    void grant(const CiphertextHandle& handle, const Principal& principal);

    /** Grant every member of the set */
    void grant_all(const CiphertextHandle& handle, const GrantSet& principals);

    bool may_decrypt(const CiphertextHandle& handle, const Principal& principal) const;

    /** Grantees of handle in ascending byte order; empty if none */
    std::vector<Principal> grants_of(const CiphertextHandle& handle) const;

    /** Number of handles holding at least one grant */
    size_t size() const { return grants_.size(); }

private:
    std::unordered_map<CiphertextHandle, std::set<Principal>, HandleHash> grants_;
};

} // namespace acl
} // namespace trustledger

#endif // TRUSTLEDGER_ACL_CAPABILITY_DIRECTORY_H
