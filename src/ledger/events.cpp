/**
 * @file events.cpp
 * @brief Ledger notification recorder
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/ledger/events.h"

#include <sstream>

namespace trustledger {
namespace ledger {

const char* query_kind_name(QueryKind kind) {
    switch (kind) {
        case QueryKind::Record:
            return "RECORD";
        case QueryKind::Statistics:
            return "STATISTICS";
        default:
            return "UNKNOWN";
    }
}

std::string LedgerEvent::to_string() const {
    std::ostringstream oss;
    switch (type) {
        case EventType::TrustEventRecorded:
            oss << "TrustEventRecorded(" << user.to_hex() << ", " << event_count << ")";
            break;
        case EventType::ScoreQueried:
            oss << "ScoreQueried(" << user.to_hex() << ", " << query_kind_name(kind) << ")";
            break;
        case EventType::StatisticsViewed:
            oss << "StatisticsViewed(" << user.to_hex() << ", " << event_count << ", "
                << last_activity << ")";
            break;
    }
    return oss.str();
}

void EventLog::on_trust_event_recorded(const Principal& user, uint32_t new_event_count) {
    LedgerEvent e;
    e.type = EventType::TrustEventRecorded;
    e.user = user;
    e.event_count = new_event_count;
    events_.push_back(e);
}

void EventLog::on_score_queried(const Principal& user, QueryKind kind) {
    LedgerEvent e;
    e.type = EventType::ScoreQueried;
    e.user = user;
    e.kind = kind;
    events_.push_back(e);
}

void EventLog::on_statistics_viewed(const Principal& user, uint32_t event_count,
                                    Timestamp last_activity) {
    LedgerEvent e;
    e.type = EventType::StatisticsViewed;
    e.user = user;
    e.event_count = event_count;
    e.last_activity = last_activity;
    events_.push_back(e);
}

} // namespace ledger
} // namespace trustledger
