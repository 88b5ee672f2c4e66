/**
 * @file reencryption_service.h
 * @brief Remote re-encryption collaborator and its in-process gateway
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_REVEAL_REENCRYPTION_SERVICE_H
#define TRUSTLEDGER_REVEAL_REENCRYPTION_SERVICE_H

#include "trustledger/fhe/executor.h"
#include "trustledger/host/clock.h"
#include "trustledger/reveal/authorization.h"

namespace trustledger {
namespace reveal {

/**
 * @brief Turns a signed decryption request into a session-key-sealed value
 *
 * Implementations report transport failures as
 * LedgerError(REMOTE_SERVICE_UNAVAILABLE) and refused requests as
 * LedgerError(CAPABILITY_DENIED). No retry is performed here.
 */
class ReencryptionService {
public:
    virtual ~ReencryptionService() = default;

    virtual SealedValue reencrypt(const DecryptionRequest& request) = 0;
};

/**
 * @brief Gateway co-located with the executor's key custodian
 *
 * Honors a request only if
 *   - it targets this executor's system;
 *   - the holder key hashes to the holder principal;
 *   - the signature verifies over the authorization digest;
 *   - the authorization is within its window and names the system;
 *   - both the holder and the system hold grants on the handle.
 */
class KmsGateway : public ReencryptionService {
public:
    KmsGateway(const fhe::FheExecutor& executor, const host::HostClock& clock)
        : executor_(executor), clock_(clock) {}

    SealedValue reencrypt(const DecryptionRequest& request) override;

    /** Simulated outage: while offline every request fails RemoteServiceUnavailable */
    void set_online(bool online) { online_ = online; }
    bool online() const { return online_; }

    size_t requests_served() const { return served_; }

private:
    const fhe::FheExecutor& executor_;
    const host::HostClock& clock_;
    bool online_ = true;
    size_t served_ = 0;
};

} // namespace reveal
} // namespace trustledger

#endif // TRUSTLEDGER_REVEAL_REENCRYPTION_SERVICE_H
