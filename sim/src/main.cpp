// avault scenario simulator
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Runs a JSON scenario of vault operations against the in-memory
// collaborators, logs every event, and reports share price / TVL metrics.

#include <avault/config.hpp>
#include <avault/controller.hpp>
#include <avault/math.hpp>
#include <avault/memory.hpp>
#include <avault/metrics.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace avault;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    std::string metrics_path;
    bool verbose = false;
};

//------------------------------------------------------------------------------
// Simulated Vault
//------------------------------------------------------------------------------

class Simulation {
public:
    Simulation(const VaultConfig& config, uint64_t start_time, bool verbose)
        : config_(config)
        , now_(start_time)
        , verbose_(verbose)
        , book_(rates_, config.vault, config.canonical_asset)
    {
        for (const auto& asset : config.assets) rates_.set_rate(asset.asset, asset.rate);
        for (const auto& op : config.operators) access_.grant_role(Role::OPERATOR, op);
        for (const auto& fm : config.fee_managers) access_.grant_role(Role::FEE_MANAGER, fm);
        for (const auto& b : config.balances) book_.credit(b.holder, b.asset, b.amount);
        for (const auto& s : config.shares) shares_.mint(s.holder, s.amount);

        // Created after seeding so the initial high-water mark sees the seeded vault
        controller_ = std::make_unique<RedemptionController>(
            config.to_controller_config(),
            Collaborators{shares_, book_, book_, rates_, access_, pause_},
            [this]() { return now_; });
        controller_->set_event_callback([this](const VaultEvent& event) { print_event(event); });
    }

    // Throws VaultError / ConfigError; the caller decides whether it was expected
    void apply(const json& step) {
        if (step.contains("time")) now_ = step["time"].get<uint64_t>();
        if (step.contains("advance")) now_ += step["advance"].get<uint64_t>();

        std::string op = step.at("op").get<std::string>();

        if (op == "request_redeem") {
            controller_->request_redeem(address(step, "caller"), asset(step), amount(step, "shares"),
                                       address(step, "controller"), address(step, "owner"));
        } else if (op == "cancel_redeem") {
            controller_->cancel_redeem(address(step, "caller"), asset(step),
                                      address(step, "controller"), address(step, "receiver"));
        } else if (op == "cancel_redeem_partial") {
            controller_->cancel_redeem_partial(address(step, "caller"), asset(step), amount(step, "shares"),
                                              address(step, "controller"), address(step, "receiver"));
        } else if (op == "fulfill_redeem") {
            controller_->fulfill_redeem(address(step, "caller"), asset(step), amount(step, "shares"),
                                       address(step, "controller"));
        } else if (op == "fulfill_redeems") {
            std::vector<Asset> assets;
            std::vector<U128> shares;
            std::vector<Address> controllers;
            for (const auto& entry : step.at("entries")) {
                assets.push_back(asset(entry));
                shares.push_back(amount(entry, "shares"));
                controllers.push_back(address(entry, "controller"));
            }
            controller_->fulfill_redeems(address(step, "caller"), assets, shares, controllers);
        } else if (op == "withdraw") {
            controller_->withdraw(address(step, "caller"), asset(step), amount(step, "assets"),
                                 address(step, "receiver"), address(step, "controller"));
        } else if (op == "redeem") {
            controller_->redeem(address(step, "caller"), asset(step), amount(step, "shares"),
                               address(step, "receiver"), address(step, "controller"));
        } else if (op == "deposit") {
            controller_->deposit(address(step, "caller"), asset(step), amount(step, "assets"),
                                address(step, "receiver"));
        } else if (op == "settle_fees") {
            controller_->settle_fees();
        } else if (op == "set_fees") {
            FeeRates rates = controller_->fees().rates;
            if (step.contains("performance")) rates.performance_fee_rate = config::parse_rate(step["performance"], "performance");
            if (step.contains("management")) rates.management_fee_rate = config::parse_rate(step["management"], "management");
            if (step.contains("withdrawal")) rates.withdrawal_fee_rate = config::parse_rate(step["withdrawal"], "withdrawal");
            controller_->set_fees(address(step, "caller"), rates);
        } else if (op == "set_operator") {
            access_.set_operator(address(step, "controller"), address(step, "operator"),
                                 step.value("approved", true));
        } else if (op == "set_rate") {
            rates_.set_rate(asset(step), config::parse_rate(step.at("rate"), "rate"));
        } else if (op == "yield") {
            // Strategy gain lands in vault custody
            book_.credit(config_.vault, asset(step), amount(step, "assets"));
        } else if (op == "pause") {
            pause_.pause();
        } else if (op == "unpause") {
            pause_.unpause();
        } else if (op != "snapshot") {
            throw ConfigError("unknown op: " + op);
        }
    }

    VaultMetric sample(uint64_t sequence) const {
        return observe(controller_->totals(), config_.underlying_decimals, config_.decimals_offset,
                       now_, sequence);
    }

    void print_state() const {
        Totals t = controller_->totals();
        std::cout << "  totals: assets=" << math::to_string(t.total_assets)
                  << " supply=" << math::to_string(t.total_supply)
                  << " share_value=" << math::to_string(t.share_value)
                  << " hwm=" << math::to_string(controller_->fees().high_water_mark) << "\n";
    }

private:
    VaultConfig config_;
    uint64_t now_;
    bool verbose_;

    TableRateProvider rates_;
    MemoryShareToken shares_;
    MemoryAssetBook book_;
    MemoryAccessGate access_;
    MemoryPauseGate pause_;
    std::unique_ptr<RedemptionController> controller_;

    Address address(const json& step, const char* key) const {
        return config::parse_address(step.at(key), key);
    }

    U128 amount(const json& step, const char* key) const {
        return config::parse_amount(step.at(key), key);
    }

    Asset asset(const json& step) const {
        if (!step.contains("asset")) return config_.canonical_asset;
        return Asset(config::parse_address(step["asset"], "asset"));
    }

    void print_event(const VaultEvent& event) const {
        std::cout << "[" << event.timestamp << "] " << event_name(event.type)
                  << " controller=" << addresses::to_hex(event.controller)
                  << " asset=" << event.asset.to_hex()
                  << " assets=" << math::to_string(event.assets)
                  << " shares=" << math::to_string(event.shares);
        if (verbose_) {
            std::cout << " caller=" << addresses::to_hex(event.caller)
                      << " counterparty=" << addresses::to_hex(event.counterparty);
        }
        std::cout << "\n";
    }
};

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "avault scenario simulator\n\n"
              << "Usage: " << prog << " -c <config.json> -s <scenario.json> [options]\n\n"
              << "Options:\n"
              << "  -c, --config <file>    Vault configuration (JSON)\n"
              << "  -s, --scenario <file>  Scenario: {\"start_time\": N, \"steps\": [...]}\n"
              << "  -m, --metrics <file>   Write one metric per step as JSON lines\n"
              << "  -v, --verbose          Print totals after every step\n"
              << "  -h, --help             Show this help message\n\n"
              << "Step ops:\n"
              << "  request_redeem, cancel_redeem, cancel_redeem_partial, fulfill_redeem,\n"
              << "  fulfill_redeems, withdraw, redeem, deposit, settle_fees, set_fees,\n"
              << "  set_operator, set_rate, yield, pause, unpause, snapshot\n\n"
              << "Every step may carry \"time\" or \"advance\" (seconds) and\n"
              << "\"expect_error\" (e.g. \"Paused\") when the step must fail.\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--scenario") {
            if (i + 1 >= argc) {
                std::cerr << "Missing scenario argument\n";
                std::exit(1);
            }
            options.scenario_path = argv[++i];
        } else if (arg == "-m" || arg == "--metrics") {
            if (i + 1 >= argc) {
                std::cerr << "Missing metrics argument\n";
                std::exit(1);
            }
            options.metrics_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.config_path.empty() || options.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

json load_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }
    return json::parse(file);
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    VaultConfig config;
    json scenario;
    try {
        config = VaultConfig::from_file(options.config_path);
        scenario = load_json(options.scenario_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load: " << e.what() << "\n";
        return 1;
    }

    std::ofstream metrics_out;
    if (!options.metrics_path.empty()) {
        metrics_out.open(options.metrics_path);
        if (!metrics_out.is_open()) {
            std::cerr << "Cannot open metrics file: " << options.metrics_path << "\n";
            return 1;
        }
    }

    uint64_t start_time = scenario.value("start_time", uint64_t(1700000000));
    MetricsHistory history;
    int failures = 0;

    try {
        Simulation sim(config, start_time, options.verbose);
        history.record(sim.sample(0));

        const json& steps = scenario.at("steps");
        for (size_t i = 0; i < steps.size(); ++i) {
            const json& step = steps[i];
            std::string expected = step.value("expect_error", "");

            try {
                sim.apply(step);
                if (!expected.empty()) {
                    std::cerr << "step " << i << ": expected " << expected << " but succeeded\n";
                    ++failures;
                }
            } catch (const VaultError& e) {
                if (expected != errors::message(e.code())) {
                    std::cerr << "step " << i << " (" << step.value("op", "?") << "): " << e.what() << "\n";
                    ++failures;
                } else if (options.verbose) {
                    std::cout << "step " << i << ": rejected as expected (" << expected << ")\n";
                }
            } catch (const ConfigError& e) {
                std::cerr << "step " << i << ": " << e.what() << "\n";
                ++failures;
            } catch (const json::exception& e) {
                std::cerr << "step " << i << ": malformed step: " << e.what() << "\n";
                ++failures;
            }

            VaultMetric metric = sim.sample(i + 1);
            history.record(metric);
            if (metrics_out.is_open()) metrics_out << json(metric).dump() << "\n";
            if (options.verbose) sim.print_state();
        }
    } catch (const std::exception& e) {
        std::cerr << "Simulation aborted: " << e.what() << "\n";
        return 1;
    }

    if (auto summary = history.summarize()) {
        std::cout << json(*summary).dump(2) << "\n";
    }

    if (failures > 0) {
        std::cerr << failures << " step(s) failed\n";
        return 1;
    }
    return 0;
}
