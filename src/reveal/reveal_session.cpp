/**
 * @file reveal_session.cpp
 * @brief Reveal protocol state machine
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "trustledger/reveal/reveal_session.h"
#include "trustledger/core/error.h"

#include <stdexcept>
#include <string>

namespace trustledger {
namespace reveal {

const char* reveal_state_name(RevealState state) {
    switch (state) {
        case RevealState::Idle:
            return "idle";
        case RevealState::GeneratingSessionKeys:
            return "generating_session_keys";
        case RevealState::AwaitingAuthorizationSignature:
            return "awaiting_authorization_signature";
        case RevealState::RequestingRemoteReencryption:
            return "requesting_remote_reencryption";
        case RevealState::OpeningLocally:
            return "opening_locally";
        case RevealState::Completed:
            return "completed";
        default:
            return "unknown";
    }
}

void RevealSession::expect(RevealState expected, const char* step) const {
    if (state_ != expected) {
        throw std::logic_error(std::string(step) + " called in state " + reveal_state_name(state_));
    }
}

void RevealSession::reset() {
    keys_.wipe();
    request_ = DecryptionRequest();
    reply_ = SealedValue();
    handle_ = CiphertextHandle::empty();
    value_ = 0;
    state_ = RevealState::Idle;
}

const UserDecryptAuthorization& RevealSession::begin(const CiphertextHandle& handle,
                                                     const Principal& system,
                                                     const Principal& holder, Timestamp now,
                                                     uint32_t duration_days) {
    expect(RevealState::Idle, "begin");
    if (!directory_.may_decrypt(handle, holder)) {
        throw LedgerError(TRUSTLEDGER_ERROR_CAPABILITY_DENIED,
                          "Holder " + holder.to_hex() + " may not decrypt " + handle.to_hex());
    }

    state_ = RevealState::GeneratingSessionKeys;
    try {
        keys_ = SessionKeyPair::generate();
    } catch (...) {
        reset();
        throw;
    }

    handle_ = handle;
    request_.handle = handle;
    request_.system = system;
    request_.holder = holder;
    request_.authorization.session_public_key = keys_.public_key();
    request_.authorization.systems = {system};
    request_.authorization.start_timestamp = now;
    request_.authorization.duration_days = duration_days;

    state_ = RevealState::AwaitingAuthorizationSignature;
    return request_.authorization;
}

void RevealSession::authorize(const ByteVec& holder_public_key, const ByteVec& signature) {
    expect(RevealState::AwaitingAuthorizationSignature, "authorize");
    if (signature.size() != TRUSTLEDGER_ED25519_SIG_SIZE) {
        throw std::invalid_argument("Authorization signature must be 64 bytes");
    }
    request_.holder_public_key = holder_public_key;
    request_.signature = signature;
    state_ = RevealState::RequestingRemoteReencryption;
}

void RevealSession::request_reencryption() {
    expect(RevealState::RequestingRemoteReencryption, "request_reencryption");
    try {
        reply_ = service_.reencrypt(request_);
    } catch (...) {
        reset();
        throw;
    }
    state_ = RevealState::OpeningLocally;
}

uint32_t RevealSession::open() {
    expect(RevealState::OpeningLocally, "open");
    try {
        value_ = open_sealed(reply_, handle_, keys_);
    } catch (...) {
        reset();
        throw;
    }
    keys_.wipe();
    state_ = RevealState::Completed;
    return value_;
}

uint32_t RevealSession::run(const CiphertextHandle& handle, const Principal& system,
                            const Wallet& wallet, Timestamp now) {
    const UserDecryptAuthorization& auth = begin(handle, system, wallet.principal(), now);
    authorize(wallet.public_key(), wallet.sign(auth.signing_digest()));
    request_reencryption();
    return open();
}

uint32_t RevealSession::value() const {
    expect(RevealState::Completed, "value");
    return value_;
}

} // namespace reveal
} // namespace trustledger
