/**
 * @file query.cpp
 * @brief Query layer
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/query.h"
#include "trustledger/core/error.h"

namespace trustledger {
namespace ledger {

namespace {

void require_address(const Principal& user) {
    if (user.is_zero()) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_ADDRESS, "Invalid user address");
    }
}

} // namespace

CiphertextHandle QueryLayer::total(const Principal& user) const {
    const UserRecord* rec = store_.find(user);
    return rec ? rec->aggregate.total : CiphertextHandle::empty();
}

CiphertextHandle QueryLayer::average(const Principal& user) const {
    const UserRecord* rec = store_.find(user);
    return rec ? rec->aggregate.average : CiphertextHandle::empty();
}

uint32_t QueryLayer::event_count(const Principal& user) const {
    const UserRecord* rec = store_.find(user);
    return rec ? rec->aggregate.event_count : 0;
}

size_t QueryLayer::history_length(const Principal& user) const {
    const UserRecord* rec = store_.find(user);
    return rec ? rec->history.size() : 0;
}

Timestamp QueryLayer::last_activity(const Principal& user) const {
    const UserRecord* rec = store_.find(user);
    return rec ? rec->aggregate.last_activity : 0;
}

CiphertextHandle QueryLayer::by_index(const Principal& user, size_t index) const {
    require_address(user);
    const UserRecord* rec = store_.find(user);
    if (rec == nullptr || index >= rec->history.size()) {
        throw LedgerError(TRUSTLEDGER_ERROR_INDEX_OUT_OF_BOUNDS, "Index out of bounds");
    }
    return rec->history[index];
}

std::vector<CiphertextHandle> QueryLayer::range(const Principal& user, size_t start,
                                                size_t end) const {
    require_address(user);
    if (start >= end) {
        throw LedgerError(TRUSTLEDGER_ERROR_INVALID_RANGE, "Invalid range");
    }
    const UserRecord* rec = store_.find(user);
    if (rec == nullptr || end > rec->history.size()) {
        throw LedgerError(TRUSTLEDGER_ERROR_RANGE_OUT_OF_BOUNDS, "End index out of bounds");
    }
    return std::vector<CiphertextHandle>(rec->history.begin() + start, rec->history.begin() + end);
}

Statistics QueryLayer::live_statistics(const Principal& user) const {
    require_address(user);
    const UserRecord* rec = store_.find(user);
    return rec ? rec->live_statistics() : Statistics();
}

Statistics QueryLayer::cached_statistics(const Principal& user) const {
    return cached_word(user).unpack();
}

PackedStatistics QueryLayer::cached_word(const Principal& user) const {
    const UserRecord* rec = store_.find(user);
    return rec ? rec->cached : PackedStatistics();
}

} // namespace ledger
} // namespace trustledger
