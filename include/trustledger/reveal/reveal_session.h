/**
 * @file reveal_session.h
 * @brief Client-side decrypt-on-demand state machine
 *
 * @code
 *   Idle -> GeneratingSessionKeys -> AwaitingAuthorizationSignature
 *        -> RequestingRemoteReencryption -> OpeningLocally -> Completed
 * @endcode
 *
 * Each step is an explicit call so the host can suspend between them (the
 * signature step waits on a human; the re-encryption step on the network).
 * cancel() returns to Idle from any state and discards the session keys.
 * A failed re-encryption also returns to Idle. Calling a step out of order
 * raises std::logic_error.
 *
 * One session reveals one handle. Sessions share no state and hold no
 * reference into the ledger store.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef TRUSTLEDGER_REVEAL_REVEAL_SESSION_H
#define TRUSTLEDGER_REVEAL_REVEAL_SESSION_H

#include "trustledger/acl/capability_directory.h"
#include "trustledger/reveal/authorization.h"
#include "trustledger/reveal/reencryption_service.h"
#include "trustledger/reveal/session_keys.h"
#include "trustledger/reveal/wallet.h"

#include <cstdint>

namespace trustledger {
namespace reveal {

enum class RevealState : uint8_t {
    Idle,
    GeneratingSessionKeys,
    AwaitingAuthorizationSignature,
    RequestingRemoteReencryption,
    OpeningLocally,
    Completed
};

const char* reveal_state_name(RevealState state);

class RevealSession {
public:
    RevealSession(const acl::CapabilityDirectory& directory, ReencryptionService& service)
        : directory_(directory), service_(service) {}

    ~RevealSession() { reset(); }

    RevealSession(const RevealSession&) = delete;
    RevealSession& operator=(const RevealSession&) = delete;

    /**
     * @brief Generate session keys and build the authorization to sign
     * @return Authorization message; sign its signing_digest()
     * @throws LedgerError(CAPABILITY_DENIED) if holder has no grant on handle
     * @throws std::logic_error unless Idle
     */
    const UserDecryptAuthorization& begin(const CiphertextHandle& handle, const Principal& system,
                                          const Principal& holder, Timestamp now,
                                          uint32_t duration_days = MIN_AUTHORIZATION_DAYS);

    /**
     * @brief Supply the holder's signature over the authorization
     * @throws std::logic_error unless AwaitingAuthorizationSignature
     */
    void authorize(const ByteVec& holder_public_key, const ByteVec& signature);

    /**
     * @brief Send the request to the service
     *
     * On failure the session returns to Idle and the error is rethrown
     * (RemoteServiceUnavailable, CapabilityDenied).
     * @throws std::logic_error unless RequestingRemoteReencryption
     */
    void request_reencryption();

    /**
     * @brief Open the sealed reply with the session key
     * @throws std::logic_error unless OpeningLocally
     */
    uint32_t open();

    /** Back to Idle; discards keys and any reply */
    void cancel() { reset(); }

    /** begin + authorize + request_reencryption + open with a local wallet */
    uint32_t run(const CiphertextHandle& handle, const Principal& system, const Wallet& wallet,
                 Timestamp now);

    RevealState state() const { return state_; }
    const CiphertextHandle& handle() const { return handle_; }

    /** @throws std::logic_error unless Completed */
    uint32_t value() const;

private:
    void expect(RevealState expected, const char* step) const;
    void reset();

    const acl::CapabilityDirectory& directory_;
    ReencryptionService& service_;

    RevealState state_ = RevealState::Idle;
    CiphertextHandle handle_;
    DecryptionRequest request_;
    SessionKeyPair keys_;
    SealedValue reply_;
    uint32_t value_ = 0;
};

} // namespace reveal
} // namespace trustledger

#endif // TRUSTLEDGER_REVEAL_REVEAL_SESSION_H
