// avault - Conservation and failure-atomicity over random operation sequences

#include <catch2/catch_test_macros.hpp>

#include <random>

#include "test_helpers.hpp"

using namespace avault;
using avault::testing::Harness;
using avault::testing::thrown_code;

namespace {

struct Snapshot {
    std::vector<PendingRedeem> pending;
    std::vector<ClaimableRedeem> claimable;
    Fees fees;
    U128 redeemed = 0;

    bool operator==(const Snapshot& o) const {
        if (pending.size() != o.pending.size() || claimable.size() != o.claimable.size()) return false;
        for (size_t i = 0; i < pending.size(); ++i) {
            if (pending[i].shares != o.pending[i].shares
                || pending[i].request_time != o.pending[i].request_time) return false;
        }
        for (size_t i = 0; i < claimable.size(); ++i) {
            if (claimable[i].assets != o.claimable[i].assets
                || claimable[i].shares != o.claimable[i].shares) return false;
        }
        return fees.high_water_mark == o.fees.high_water_mark
            && fees.last_update_timestamp == o.fees.last_update_timestamp
            && redeemed == o.redeemed;
    }
};

class RandomRun {
public:
    explicit RandomRun(uint32_t seed) : rng_(seed) {
        h_.seed_vault(h_.usd, 1000000);
        h_.seed_vault(h_.eur, 2000000);
        h_.seed_vault(h_.par, 1000000);
        for (const Address& a : actors()) {
            h_.mint_shares(a, 1000000);
            h_.book.credit(a, h_.usd, 1000000);
            h_.book.credit(a, h_.eur, 1000000);
        }

        FeeRates rates;
        rates.performance_fee_rate = x18::from_string("0.1");
        rates.management_fee_rate = x18::from_string("0.02");
        rates.withdrawal_fee_rate = x18::from_string("0.01");
        h_.start(rates);
    }

    std::vector<Address> actors() const { return {h_.alice, h_.bob, h_.carol}; }
    std::vector<Asset> assets() const { return {h_.usd, h_.eur, h_.par}; }

    Snapshot snapshot() const {
        Snapshot s;
        for (const Address& a : actors()) {
            for (const Asset& asset : assets()) {
                s.pending.push_back(vault().pending(asset, a));
                s.claimable.push_back(vault().claimable(asset, a));
            }
        }
        s.fees = vault().fees();
        s.redeemed = vault().redeemed_shares();
        return s;
    }

    // Σ pending + Σ claimable shares + circulating == minted - redeemed
    void check_conservation() const {
        U128 pending = 0;
        U128 claimable = 0;
        for (const Asset& asset : assets()) {
            auto totals = vault().ledger().asset_totals(asset);
            pending += totals.pending_shares;
            claimable += totals.claimable_shares;
        }
        U128 circulating = h_.shares.total_supply() - h_.escrow();

        REQUIRE(pending == h_.escrow());
        REQUIRE(pending + claimable + circulating == h_.shares.total_minted() - vault().redeemed_shares());
        REQUIRE(h_.shares.total_burned() == claimable + vault().redeemed_shares());
    }

    void step() {
        const Address who = pick(actors());
        const Asset asset = pick(assets());
        const U128 amount = rng_() % 200000;
        const Address other = pick(actors());

        int op = static_cast<int>(rng_() % 9);
        Snapshot before = snapshot();
        U128 hwm_before = vault().fees().high_water_mark;

        int32_t code = thrown_code([&] {
            switch (op) {
                case 0:
                    vault().request_redeem(who, asset, amount, who, who);
                    break;
                case 1:
                    vault().cancel_redeem_partial(who, asset, amount, who, who);
                    break;
                case 2: {
                    U128 pending = vault().pending(asset, who).shares;
                    vault().fulfill_redeem(h_.op, asset, pending == 0 ? amount : 1 + amount % pending, who);
                    break;
                }
                case 3: {
                    std::vector<Asset> as{asset, pick(assets())};
                    std::vector<Address> cs{who, other};
                    std::vector<U128> ss{vault().pending(as[0], cs[0]).shares / 2,
                                         vault().pending(as[1], cs[1]).shares / 2};
                    vault().fulfill_redeems(h_.op, as, ss, cs);
                    break;
                }
                case 4: {
                    U128 max = vault().max_withdraw(asset, who);
                    vault().withdraw(who, asset, max == 0 ? amount : 1 + amount % max, other, who);
                    break;
                }
                case 5: {
                    U128 max = vault().max_redeem(asset, who);
                    vault().redeem(who, asset, max == 0 ? amount : 1 + amount % max, other, who);
                    break;
                }
                case 6:
                    vault().deposit(who, asset, amount, other);
                    break;
                case 7:
                    h_.book.credit(h_.vault, h_.usd, amount / 10);
                    break;
                default:
                    h_.now += 3600 + amount;
                    vault().settle_fees();
                    break;
            }
        });

        if (code != errors::OK) {
            REQUIRE(snapshot() == before);
        }
        REQUIRE(vault().fees().high_water_mark >= hwm_before);
        check_conservation();
    }

private:
    Harness h_;
    std::mt19937 rng_;

    RedemptionController& vault() const { return *h_.controller; }

    template <typename T>
    T pick(const std::vector<T>& items) {
        return items[rng_() % items.size()];
    }
};

} // namespace

TEST_CASE("Shares are conserved across random operation sequences", "[invariants]") {
    for (uint32_t seed : {1u, 7u, 42u, 2024u}) {
        RandomRun run(seed);
        run.check_conservation();
        for (int i = 0; i < 400; ++i) {
            run.step();
        }
    }
}
