/**
 * @file events.h
 * @brief Ledger notifications
 *
 * Notifications are delivered synchronously, after the mutation that caused
 * them has committed.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_LEDGER_EVENTS_H
#define TRUSTLEDGER_LEDGER_EVENTS_H

#include "trustledger/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace trustledger {
namespace ledger {

enum class QueryKind : uint8_t {
    Record = 0,
    Statistics = 1
};

const char* query_kind_name(QueryKind kind);

class LedgerEventListener {
public:
    virtual ~LedgerEventListener() = default;

    virtual void on_trust_event_recorded(const Principal& user, uint32_t new_event_count) = 0;
    virtual void on_score_queried(const Principal& user, QueryKind kind) = 0;
    virtual void on_statistics_viewed(const Principal& user, uint32_t event_count,
                                      Timestamp last_activity) = 0;
};

enum class EventType : uint8_t {
    TrustEventRecorded,
    ScoreQueried,
    StatisticsViewed
};

struct LedgerEvent {
    EventType type;
    Principal user;
    uint32_t event_count = 0;       ///< TrustEventRecorded, StatisticsViewed
    Timestamp last_activity = 0;    ///< StatisticsViewed
    QueryKind kind = QueryKind::Record;  ///< ScoreQueried

    std::string to_string() const;
};

/**
 * @brief Listener that records every notification in order
 */
class EventLog : public LedgerEventListener {
public:
    void on_trust_event_recorded(const Principal& user, uint32_t new_event_count) override;
    void on_score_queried(const Principal& user, QueryKind kind) override;
    void on_statistics_viewed(const Principal& user, uint32_t event_count,
                              Timestamp last_activity) override;

    const std::vector<LedgerEvent>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    void clear() { events_.clear(); }

private:
    std::vector<LedgerEvent> events_;
};

} // namespace ledger
} // namespace trustledger

#endif // TRUSTLEDGER_LEDGER_EVENTS_H
