/**
 * @file export.cpp
 * @brief C API implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/trustledger_api.h"
#include "trustledger/ledger/statistics.h"

#include <cstring>
#include <exception>

extern "C" {

const char* trustledger_version(void) {
    return TRUSTLEDGER_VERSION_STRING;
}

const char* trustledger_platform(void) {
    return TRUSTLEDGER_PLATFORM_NAME;
}

const char* trustledger_error_string(trustledger_error_t error) {
    switch (error) {
        case TRUSTLEDGER_SUCCESS:
            return "Success";
        case TRUSTLEDGER_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case TRUSTLEDGER_ERROR_INVALID_ADDRESS:
            return "Invalid user address";
        case TRUSTLEDGER_ERROR_EMPTY_PROOF:
            return "Empty proof";
        case TRUSTLEDGER_ERROR_INVALID_PROOF:
            return "Invalid proof";
        case TRUSTLEDGER_ERROR_CAPACITY_EXCEEDED:
            return "Maximum trust events reached";
        case TRUSTLEDGER_ERROR_INDEX_OUT_OF_BOUNDS:
            return "Index out of bounds";
        case TRUSTLEDGER_ERROR_INVALID_RANGE:
            return "Invalid range";
        case TRUSTLEDGER_ERROR_RANGE_OUT_OF_BOUNDS:
            return "End index out of bounds";
        case TRUSTLEDGER_ERROR_BATCH_SIZE_INVALID:
            return "Invalid batch size";
        case TRUSTLEDGER_ERROR_REMOTE_SERVICE_UNAVAILABLE:
            return "Remote service unavailable";
        case TRUSTLEDGER_ERROR_CAPABILITY_DENIED:
            return "Capability denied";
        case TRUSTLEDGER_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case TRUSTLEDGER_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

trustledger_error_t trustledger_stats_pack(const trustledger_stats_t* stats, uint8_t* out,
                                           size_t out_len) {
    if (stats == nullptr || out == nullptr) {
        return TRUSTLEDGER_ERROR_INVALID_PARAM;
    }
    if (out_len < TRUSTLEDGER_STATS_WORD_SIZE) {
        return TRUSTLEDGER_ERROR_BUFFER_TOO_SMALL;
    }
    trustledger::ledger::Statistics s;
    s.event_count = stats->event_count;
    s.last_activity = stats->last_activity;
    s.has_data = stats->has_data != 0;
    trustledger::ledger::PackedStatistics packed = trustledger::ledger::PackedStatistics::pack(s);
    std::memcpy(out, packed.bytes().data(), TRUSTLEDGER_STATS_WORD_SIZE);
    return TRUSTLEDGER_SUCCESS;
}

trustledger_error_t trustledger_stats_unpack(const uint8_t* word, size_t len,
                                             trustledger_stats_t* stats) {
    if (word == nullptr || stats == nullptr || len != TRUSTLEDGER_STATS_WORD_SIZE) {
        return TRUSTLEDGER_ERROR_INVALID_PARAM;
    }
    try {
        auto packed = trustledger::ledger::PackedStatistics::from_bytes(word, len);
        if (packed.has_reserved_bits()) {
            return TRUSTLEDGER_ERROR_INVALID_PARAM;
        }
        trustledger::ledger::Statistics s = packed.unpack();
        stats->event_count = s.event_count;
        stats->last_activity = static_cast<uint32_t>(s.last_activity);
        stats->has_data = s.has_data ? 1 : 0;
        return TRUSTLEDGER_SUCCESS;
    } catch (const std::exception&) {
        return TRUSTLEDGER_ERROR_INTERNAL;
    }
}

} // extern "C"
