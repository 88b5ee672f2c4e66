/**
 * @file capability_directory.cpp
 * @brief Capability directory implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/acl/capability_directory.h"

#include <stdexcept>

namespace trustledger {
namespace acl {

void CapabilityDirectory::grant(const CiphertextHandle& handle, const Principal& principal) {
    if (handle.is_empty()) {
        throw std::invalid_argument("Cannot grant on the empty handle");
    }
    if (principal.is_zero()) {
        throw std::invalid_argument("Cannot grant to the zero principal");
    }
    grants_[handle].insert(principal);
}

void CapabilityDirectory::grant_all(const CiphertextHandle& handle, const GrantSet& principals) {
    for (const auto& p : principals) {
        grant(handle, p);
    }
}

bool CapabilityDirectory::may_decrypt(const CiphertextHandle& handle,
                                      const Principal& principal) const {
    auto it = grants_.find(handle);
    if (it == grants_.end()) {
        return false;
    }
    return it->second.count(principal) != 0;
}

std::vector<Principal> CapabilityDirectory::grants_of(const CiphertextHandle& handle) const {
    auto it = grants_.find(handle);
    if (it == grants_.end()) {
        return {};
    }
    return std::vector<Principal>(it->second.begin(), it->second.end());
}

} // namespace acl
} // namespace trustledger
