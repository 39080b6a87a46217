#ifndef AVAULT_COLLABORATORS_HPP
#define AVAULT_COLLABORATORS_HPP

#include "types.hpp"

namespace avault {

// =============================================================================
// Collaborator Interfaces
//
// Everything the redemption core consumes from its host. Implementations may
// call back into the controller; the controller treats every call below as a
// re-entry point.
// =============================================================================

// Per-asset rate conversion (oracle-backed in production)
class RateProvider {
public:
    virtual ~RateProvider() = default;

    virtual U128 convert_to_underlying(const Asset& asset, U128 amount) const = 0;
    virtual U128 convert_from_underlying(const Asset& asset, U128 amount) const = 0;
    virtual bool is_supported(const Asset& asset) const = 0;
};

// Asset custody. Both calls throw on insufficient balance.
class AssetTransfer {
public:
    virtual ~AssetTransfer() = default;

    // Move assets out of an account the vault controls
    virtual void transfer(const Asset& asset, const Address& from, const Address& to, U128 amount) = 0;

    // Pull assets from a holder that approved the vault
    virtual void transfer_from(const Asset& asset, const Address& from, const Address& to, U128 amount) = 0;
};

// Gross underlying value of everything the vault custodies
class HoldingsSource {
public:
    virtual ~HoldingsSource() = default;

    virtual U128 gross_assets() const = 0;
};

// The vault's share token.
//
// The controller moves assets before it mints or burns, and checks first that
// the resulting supply fits in 128 bits and that burned shares are held in
// escrow. Under those conditions mint and burn must not fail.
class ShareToken {
public:
    virtual ~ShareToken() = default;

    virtual U128 balance_of(const Address& holder) const = 0;
    virtual U128 total_supply() const = 0;

    virtual void transfer(const Address& from, const Address& to, U128 amount) = 0;
    virtual void mint(const Address& to, U128 amount) = 0;
    virtual void burn(const Address& from, U128 amount) = 0;
};

// Capability checks
class AccessGate {
public:
    virtual ~AccessGate() = default;

    // caller is controller itself or an operator approved by controller
    virtual bool is_authorized(const Address& controller, const Address& caller) const = 0;
    virtual bool has_role(Role role, const Address& caller) const = 0;
};

class PauseGate {
public:
    virtual ~PauseGate() = default;

    virtual bool is_paused() const = 0;
};

} // namespace avault

#endif // AVAULT_COLLABORATORS_HPP
