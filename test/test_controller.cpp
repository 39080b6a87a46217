// avault - RedemptionController tests

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

using namespace avault;
using avault::testing::Harness;
using avault::testing::thrown_code;

namespace {

FeeRates withdrawal_only(const char* rate) {
    FeeRates rates;
    rates.withdrawal_fee_rate = x18::from_string(rate);
    return rates;
}

} // namespace

TEST_CASE("Request, fulfill and withdraw with a withdrawal fee", "[controller]") {
    Harness h;
    h.seed_vault(h.par, 1000);
    h.mint_shares(h.alice, 1000);
    auto& vault = h.start(withdrawal_only("0.01"));

    REQUIRE(vault.request_redeem(h.alice, h.par, 100, h.alice, h.alice) == REQUEST_ID);
    REQUIRE(vault.pending(h.par, h.alice).shares == 100);
    REQUIRE(vault.pending(h.par, h.alice).request_time == h.now);
    REQUIRE(h.shares.balance_of(h.alice) == 900);
    REQUIRE(h.escrow() == 100);

    REQUIRE(vault.fulfill_redeem(h.op, h.par, 100, h.alice) == 99);

    ClaimableRedeem claim = vault.claimable(h.par, h.alice);
    REQUIRE(claim.assets == 99);
    REQUIRE(claim.shares == 100);
    REQUIRE(vault.pending(h.par, h.alice).shares == 0);
    REQUIRE(h.escrow() == 0);
    REQUIRE(h.shares.total_supply() == 900);
    REQUIRE(h.book.balance_of(h.fee_recipient, h.par) == 1);
    REQUIRE(vault.max_withdraw(h.par, h.alice) == 99);
    REQUIRE(vault.max_redeem(h.par, h.alice) == 100);

    // Reserved assets are no longer part of NAV
    REQUIRE(vault.totals().total_assets == 900);

    REQUIRE(vault.withdraw(h.alice, h.par, 99, h.alice, h.alice) == 100);

    claim = vault.claimable(h.par, h.alice);
    REQUIRE(claim.assets == 0);
    REQUIRE(claim.shares == 0);
    REQUIRE(h.book.balance_of(h.alice, h.par) == 99);
    REQUIRE(vault.redeemed_shares() == 100);
    REQUIRE(vault.totals().total_assets == 900);

    REQUIRE(h.events.size() == 3);
    REQUIRE(h.events[0].type == EventType::REDEEM_REQUESTED);
    REQUIRE(h.events[1].type == EventType::REDEEM_FULFILLED);
    REQUIRE(h.events[1].assets == 99);
    REQUIRE(h.events[1].shares == 100);
    REQUIRE(h.events[2].type == EventType::WITHDRAWN);
    REQUIRE(h.events[2].counterparty == h.alice);
}

TEST_CASE("Request validation", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.mint_shares(h.alice, 1000);
    auto& vault = h.start();

    SECTION("Canonical short form") {
        vault.request_redeem(h.alice, 10, h.bob, h.alice);
        REQUIRE(vault.pending(h.usd, h.bob).shares == 10);
    }

    SECTION("Zero shares") {
        REQUIRE(thrown_code([&] { vault.request_redeem(h.alice, 0, h.alice, h.alice); })
                == errors::NOTHING_TO_REDEEM);
    }

    SECTION("Unsupported asset") {
        Asset unknown{addresses::from_id(999)};
        REQUIRE(thrown_code([&] { vault.request_redeem(h.alice, unknown, 10, h.alice, h.alice); })
                == errors::ASSET_NOT_SUPPORTED);
    }

    SECTION("Spending someone else's shares needs operator approval") {
        REQUIRE(thrown_code([&] { vault.request_redeem(h.bob, 10, h.bob, h.alice); })
                == errors::UNAUTHORIZED);

        h.access.set_operator(h.alice, h.bob, true);
        vault.request_redeem(h.bob, 10, h.bob, h.alice);
        REQUIRE(vault.pending(h.usd, h.bob).shares == 10);
        REQUIRE(h.shares.balance_of(h.alice) == 990);
    }

    SECTION("Insufficient balance") {
        REQUIRE(thrown_code([&] { vault.request_redeem(h.alice, 1001, h.alice, h.alice); })
                == errors::INSUFFICIENT_BALANCE);
        REQUIRE(vault.ledger().pending_count() == 0);
    }

    SECTION("Paused") {
        h.pause.pause();
        REQUIRE(thrown_code([&] { vault.request_redeem(h.alice, 10, h.alice, h.alice); })
                == errors::PAUSED);
        h.pause.unpause();
        REQUIRE_NOTHROW(vault.request_redeem(h.alice, 10, h.alice, h.alice));
    }
}

TEST_CASE("Cancel returns escrowed shares", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.mint_shares(h.alice, 1000);
    auto& vault = h.start();
    vault.request_redeem(h.alice, 100, h.alice, h.alice);

    SECTION("Full cancel") {
        REQUIRE(vault.cancel_redeem(h.alice, h.usd, h.alice, h.alice) == 100);
        REQUIRE(vault.pending(h.usd, h.alice).shares == 0);
        REQUIRE(h.shares.balance_of(h.alice) == 1000);
        REQUIRE(h.escrow() == 0);
        REQUIRE(h.events.back().type == EventType::REDEEM_CANCELED);
    }

    SECTION("Partial cancel to another receiver") {
        vault.cancel_redeem_partial(h.alice, h.usd, 30, h.alice, h.bob);
        REQUIRE(vault.pending(h.usd, h.alice).shares == 70);
        REQUIRE(h.shares.balance_of(h.bob) == 30);
        REQUIRE(h.escrow() == 70);
    }

    SECTION("More than pending") {
        REQUIRE(thrown_code([&] { vault.cancel_redeem_partial(h.alice, h.usd, 101, h.alice, h.alice); })
                == errors::INSUFFICIENT_PENDING_SHARES);
        REQUIRE(vault.pending(h.usd, h.alice).shares == 100);
        REQUIRE(h.escrow() == 100);
    }

    SECTION("Nothing pending") {
        REQUIRE(thrown_code([&] { vault.cancel_redeem(h.bob, h.usd, h.bob, h.bob); })
                == errors::NO_PENDING_REDEEM);
        REQUIRE(thrown_code([&] { vault.cancel_redeem_partial(h.alice, h.usd, 0, h.alice, h.alice); })
                == errors::NO_PENDING_REDEEM);
    }

    SECTION("Only the controller or its operator") {
        REQUIRE(thrown_code([&] { vault.cancel_redeem(h.bob, h.usd, h.alice, h.bob); })
                == errors::UNAUTHORIZED);
        h.access.set_operator(h.alice, h.bob, true);
        REQUIRE(vault.cancel_redeem(h.bob, h.usd, h.alice, h.alice) == 100);
    }

    SECTION("Paused") {
        h.pause.pause();
        REQUIRE(thrown_code([&] { vault.cancel_redeem(h.alice, h.usd, h.alice, h.alice); })
                == errors::PAUSED);
    }
}

TEST_CASE("Fulfill validation", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.mint_shares(h.alice, 1000);
    auto& vault = h.start();
    vault.request_redeem(h.alice, 100, h.alice, h.alice);

    SECTION("Operator role required") {
        REQUIRE(thrown_code([&] { vault.fulfill_redeem(h.alice, h.usd, 100, h.alice); })
                == errors::UNAUTHORIZED);
    }

    SECTION("Zero shares") {
        REQUIRE(thrown_code([&] { vault.fulfill_redeem(h.op, h.usd, 0, h.alice); })
                == errors::NOTHING_TO_REDEEM);
    }

    SECTION("More than pending leaves everything untouched") {
        REQUIRE(thrown_code([&] { vault.fulfill_redeem(h.op, h.usd, 101, h.alice); })
                == errors::INSUFFICIENT_PENDING_SHARES);
        REQUIRE(vault.pending(h.usd, h.alice).shares == 100);
        REQUIRE(vault.claimable(h.usd, h.alice).assets == 0);
        REQUIRE(h.escrow() == 100);
        REQUIRE(h.shares.total_supply() == 1000);
    }

    SECTION("Paused") {
        h.pause.pause();
        REQUIRE(thrown_code([&] { vault.fulfill_redeem(h.op, h.usd, 100, h.alice); })
                == errors::PAUSED);
    }

    SECTION("Partial fulfillment") {
        REQUIRE(vault.fulfill_redeem(h.op, h.usd, 40, h.alice) == 40);
        REQUIRE(vault.pending(h.usd, h.alice).shares == 60);
        REQUIRE(vault.claimable(h.usd, h.alice).shares == 40);
        REQUIRE(h.escrow() == 60);
    }

    SECTION("Fulfillment into a priced asset") {
        vault.request_redeem(h.alice, h.eur, 100, h.alice, h.alice);
        h.book.credit(h.vault, h.eur, 1000);
        // NAV is now 1500 for 1000 shares: 100 shares -> 149 usd -> 298 eur at 0.5 usd/eur
        U128 assets = vault.fulfill_redeem(h.op, h.eur, 100, h.alice);
        REQUIRE(assets == 298);
        REQUIRE(vault.claimable(h.eur, h.alice).assets == assets);
    }
}

TEST_CASE("Collaborator failure rolls back the whole call", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.mint_shares(h.alice, 1000);
    auto& vault = h.start(withdrawal_only("0.01"));

    // The vault holds no eur, so the withdrawal fee transfer fails
    vault.request_redeem(h.alice, h.eur, 100, h.alice, h.alice);
    size_t events_before = h.events.size();

    REQUIRE(thrown_code([&] { vault.fulfill_redeem(h.op, h.eur, 100, h.alice); })
            == errors::INSUFFICIENT_BALANCE);

    REQUIRE(vault.pending(h.eur, h.alice).shares == 100);
    REQUIRE(vault.claimable(h.eur, h.alice).assets == 0);
    REQUIRE(vault.ledger().asset_totals(h.eur).claimable_shares == 0);
    REQUIRE(h.escrow() == 100);
    REQUIRE(h.events.size() == events_before);

    // The guard was released
    h.book.credit(h.vault, h.eur, 1000);
    REQUIRE_NOTHROW(vault.fulfill_redeem(h.op, h.eur, 100, h.alice));
}

TEST_CASE("Claims", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.mint_shares(h.alice, 1000);
    auto& vault = h.start();
    vault.request_redeem(h.alice, 100, h.alice, h.alice);
    vault.fulfill_redeem(h.op, h.usd, 100, h.alice);
    REQUIRE(vault.claimable(h.usd, h.alice).assets == 100);

    SECTION("Claims stay open while paused") {
        h.pause.pause();
        REQUIRE(vault.withdraw(h.alice, h.usd, 40, h.alice, h.alice) == 40);
        REQUIRE(vault.redeem(h.alice, h.usd, 60, h.bob, h.alice) == 60);
        REQUIRE(h.book.balance_of(h.alice, h.usd) == 40);
        REQUIRE(h.book.balance_of(h.bob, h.usd) == 60);
        REQUIRE(vault.ledger().claimable_count() == 0);
    }

    SECTION("Zero amounts") {
        REQUIRE(thrown_code([&] { vault.withdraw(h.alice, h.usd, 0, h.alice, h.alice); })
                == errors::NOTHING_TO_WITHDRAW);
        REQUIRE(thrown_code([&] { vault.redeem(h.alice, h.usd, 0, h.alice, h.alice); })
                == errors::NOTHING_TO_REDEEM);
    }

    SECTION("Over-claiming") {
        REQUIRE(thrown_code([&] { vault.withdraw(h.alice, h.usd, 101, h.alice, h.alice); })
                == errors::INSUFFICIENT_CLAIMABLE_ASSETS);
        REQUIRE(thrown_code([&] { vault.redeem(h.alice, h.usd, 101, h.alice, h.alice); })
                == errors::INSUFFICIENT_CLAIMABLE_SHARES);
    }

    SECTION("Only the controller or its operator") {
        REQUIRE(thrown_code([&] { vault.withdraw(h.bob, h.usd, 10, h.bob, h.alice); })
                == errors::UNAUTHORIZED);
        h.access.set_operator(h.alice, h.bob, true);
        REQUIRE(vault.withdraw(h.bob, h.usd, 10, h.bob, h.alice) == 10);
    }

    SECTION("Partial redeem that rounds to nothing is refused") {
        Harness g;
        g.seed_vault(g.eur, 1000);
        g.mint_shares(g.alice, 1000);
        auto& v = g.start();
        g.rates.set_rate(g.eur, X18_ONE * 1000);   // 1 eur = 1000 usd
        // NAV is now 1e6 usd for 1000 shares; 3 shares -> 2997 usd -> 2 eur
        v.request_redeem(g.alice, g.eur, 3, g.alice, g.alice);
        REQUIRE(v.fulfill_redeem(g.op, g.eur, 3, g.alice) == 2);
        REQUIRE(thrown_code([&] { v.redeem(g.alice, g.eur, 1, g.alice, g.alice); })
                == errors::NOTHING_TO_WITHDRAW);
        REQUIRE(v.claimable(g.eur, g.alice).shares == 3);
    }
}

TEST_CASE("Deposits", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.mint_shares(h.alice, 1000);
    h.book.credit(h.bob, h.usd, 500);
    h.book.credit(h.bob, h.eur, 100);
    auto& vault = h.start();

    SECTION("Canonical asset") {
        REQUIRE(vault.deposit(h.bob, h.usd, 500, h.carol) == 500);
        REQUIRE(h.shares.balance_of(h.carol) == 500);
        REQUIRE(h.book.balance_of(h.bob, h.usd) == 0);
        REQUIRE(vault.totals().total_assets == 1500);
        REQUIRE(h.events.back().type == EventType::DEPOSITED);
    }

    SECTION("Priced asset") {
        REQUIRE(vault.deposit(h.bob, h.eur, 100, h.bob) == 50);
        REQUIRE(h.book.balance_of(h.vault, h.eur) == 100);
    }

    SECTION("Nothing to mint") {
        REQUIRE(thrown_code([&] { vault.deposit(h.bob, h.usd, 0, h.bob); }) == errors::NOTHING_TO_MINT);
        REQUIRE(thrown_code([&] { vault.deposit(h.bob, h.eur, 1, h.bob); }) == errors::NOTHING_TO_MINT);
        REQUIRE(h.book.balance_of(h.bob, h.eur) == 100);
    }

    SECTION("Insufficient funds mint nothing") {
        REQUIRE(thrown_code([&] { vault.deposit(h.bob, h.usd, 501, h.bob); }) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(h.shares.total_supply() == 1000);
    }

    SECTION("Paused") {
        h.pause.pause();
        REQUIRE(thrown_code([&] { vault.deposit(h.bob, h.usd, 100, h.bob); }) == errors::PAUSED);
    }

    SECTION("Quotes match execution") {
        U128 quoted = vault.convert_to_shares(h.usd, 321);
        REQUIRE(vault.deposit(h.bob, h.usd, 321, h.bob) == quoted);
        REQUIRE(vault.convert_to_assets(h.usd, quoted) <= 321);
    }
}

TEST_CASE("Deposit that would overflow the supply moves no assets", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1);
    h.mint_shares(h.alice, U128(1) << 127);
    h.book.credit(h.bob, h.usd, 3);
    auto& vault = h.start();

    // 3 * (2^127 + 1) / 2 shares fit in 128 bits, the new supply does not
    REQUIRE(vault.convert_to_shares(h.usd, 3) == (U128(3) << 126) + 1);
    REQUIRE(thrown_code([&] { vault.deposit(h.bob, h.usd, 3, h.bob); }) == errors::TOO_MANY_SHARES);

    REQUIRE(h.book.balance_of(h.bob, h.usd) == 3);
    REQUIRE(h.book.balance_of(h.vault, h.usd) == 1);
    REQUIRE(h.shares.total_supply() == U128(1) << 127);
    REQUIRE(h.events.empty());
}

TEST_CASE("A delisted asset with open claims does not block other assets", "[controller]") {
    Harness h;
    h.seed_vault(h.usd, 1000);
    h.seed_vault(h.eur, 1000);
    h.mint_shares(h.alice, 1000);
    h.mint_shares(h.bob, 500);
    h.book.credit(h.carol, h.usd, 100);
    auto& vault = h.start();

    // 100 shares -> 100 usd -> 200 eur
    vault.request_redeem(h.alice, h.eur, 100, h.alice, h.alice);
    REQUIRE(vault.fulfill_redeem(h.op, h.eur, 100, h.alice) == 200);
    vault.request_redeem(h.bob, 100, h.bob, h.bob);

    h.rates.remove(h.eur);

    // eur drops out of holdings and reservations together
    REQUIRE(vault.totals().total_assets == 1000);
    REQUIRE(vault.totals().total_supply == 1400);

    // 100 * 1001 / 1401
    REQUIRE(vault.fulfill_redeem(h.op, h.usd, 100, h.bob) == 71);
    REQUIRE_NOTHROW(vault.settle_fees());
    // 100 * 1301 / 930 against 929 usd net of bob's claim
    REQUIRE(vault.deposit(h.carol, h.usd, 100, h.carol) == 139);

    REQUIRE(vault.withdraw(h.alice, h.eur, 200, h.alice, h.alice) == 100);
    REQUIRE(h.book.balance_of(h.alice, h.eur) == 200);

    // New eur requests are refused until it is priced again
    REQUIRE(thrown_code([&] { vault.request_redeem(h.alice, h.eur, 10, h.alice, h.alice); })
            == errors::ASSET_NOT_SUPPORTED);
}

TEST_CASE("Fee accrual through the controller", "[controller][fees]") {
    Harness h;
    h.seed_vault(h.usd, 1000000000);
    h.mint_shares(h.alice, 1000000000);

    SECTION("Management fee is settled before pricing a fulfillment") {
        FeeRates rates;
        rates.management_fee_rate = x18::from_string("0.02");
        auto& vault = h.start(rates);

        vault.request_redeem(h.alice, 100000000, h.alice, h.alice);
        h.now += SECONDS_PER_YEAR;

        // 2e7 of fee mints 2e7 shares, then 1e8 shares price at 1e9+1 / 1.02e9+1
        REQUIRE(vault.fulfill_redeem(h.op, h.usd, 100000000, h.alice) == 98039215);
        REQUIRE(h.shares.balance_of(h.fee_recipient) == 20000000);
        REQUIRE(vault.fees().last_update_timestamp == h.now);

        REQUIRE(h.events[1].type == EventType::FEES_SETTLED);
        REQUIRE(h.events[1].assets == 20000000);
        REQUIRE(h.events[2].type == EventType::REDEEM_FULFILLED);
    }

    SECTION("Performance fee crystallizes once per gain") {
        FeeRates rates;
        rates.performance_fee_rate = x18::from_string("0.1");
        auto& vault = h.start(rates);
        REQUIRE(vault.fees().high_water_mark == X18_ONE);

        h.book.credit(h.vault, h.usd, 100000000);
        FeeSettlement first = vault.settle_fees();
        REQUIRE(first.performance_fee == 9999999);
        REQUIRE(first.fee_shares == 9090908);
        REQUIRE(vault.fees().high_water_mark == 1099999999900000000ULL);
        REQUIRE(h.shares.balance_of(h.fee_recipient) == 9090908);

        FeeSettlement second = vault.settle_fees();
        REQUIRE(second.total_fee() == 0);
        REQUIRE(vault.fees().high_water_mark == 1099999999900000000ULL);
    }

    SECTION("set_fees settles under the old rates first") {
        FeeRates rates;
        rates.management_fee_rate = x18::from_string("0.02");
        auto& vault = h.start(rates);

        h.now += SECONDS_PER_YEAR / 2;
        vault.set_fees(h.fee_manager, FeeRates{});
        REQUIRE(h.shares.balance_of(h.fee_recipient) == 10000000);
        REQUIRE(vault.fees().rates.management_fee_rate == 0);
        REQUIRE(vault.fees().last_update_timestamp == h.now);
        REQUIRE(h.events.back().type == EventType::FEES_UPDATED);

        h.now += SECONDS_PER_YEAR;
        REQUIRE(vault.settle_fees().fee_shares == 0);
    }

    SECTION("set_fees needs the fee manager role and valid rates") {
        auto& vault = h.start();
        REQUIRE(thrown_code([&] { vault.set_fees(h.op, FeeRates{}); }) == errors::UNAUTHORIZED);

        FeeRates too_high;
        too_high.performance_fee_rate = X18_ONE;
        REQUIRE(thrown_code([&] { vault.set_fees(h.fee_manager, too_high); }) == errors::INVALID_FEES);
    }

    SECTION("Invalid initial rates") {
        FeeRates too_high;
        too_high.withdrawal_fee_rate = X18_ONE / 10;
        REQUIRE(thrown_code([&] { h.start(too_high); }) == errors::INVALID_FEES);
    }
}

// =============================================================================
// Reentrancy
// =============================================================================

namespace {

// Share token that runs a hook in the middle of every transfer
class HookedShareToken : public MemoryShareToken {
public:
    std::function<void()> hook;

    void transfer(const Address& from, const Address& to, U128 amount) override {
        MemoryShareToken::transfer(from, to, amount);
        if (hook) {
            auto run = std::move(hook);
            hook = nullptr;
            run();
        }
    }
};

} // namespace

TEST_CASE("Re-entry from a collaborator is rejected", "[controller][reentrancy]") {
    const Address vault_addr = addresses::from_id(1);
    const Address alice = addresses::from_id(10);
    const Asset usd{addresses::from_id(100)};

    TableRateProvider rates;
    HookedShareToken shares;
    MemoryAssetBook book(rates, vault_addr, usd);
    MemoryAccessGate access;
    MemoryPauseGate pause;

    book.credit(vault_addr, usd, 1000);
    shares.mint(alice, 1000);

    ControllerConfig config;
    config.vault = vault_addr;
    config.fee_recipient = addresses::from_id(2);
    config.canonical_asset = usd;

    RedemptionController controller(config, Collaborators{shares, book, book, rates, access, pause},
                                    []() { return uint64_t(1700000000); });

    int32_t inner = errors::OK;
    shares.hook = [&]() {
        inner = thrown_code([&] { controller.request_redeem(alice, 10, alice, alice); });
    };

    controller.request_redeem(alice, 100, alice, alice);

    REQUIRE(inner == errors::REENTRANCY);
    REQUIRE(controller.pending(usd, alice).shares == 100);
    REQUIRE(shares.balance_of(vault_addr) == 100);

    // Event callbacks run after the guard is released
    int32_t from_callback = -1;
    controller.set_event_callback([&](const VaultEvent& e) {
        if (e.type == EventType::REDEEM_CANCELED) {
            from_callback = thrown_code([&] { controller.settle_fees(); });
        }
    });
    controller.cancel_redeem(alice, usd, alice, alice);
    REQUIRE(from_callback == errors::OK);
}
