#ifndef AVAULT_METRICS_HPP
#define AVAULT_METRICS_HPP

#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace avault {

// =============================================================================
// Vault Metrics
// =============================================================================

struct VaultMetric {
    uint64_t timestamp = 0;     // seconds
    uint64_t sequence = 0;      // block number or step; unique per sample
    U128 total_assets = 0;
    U128 total_supply = 0;
    double tvl = 0.0;           // total_assets / 10^underlying_decimals
    double share_price = 1.0;   // underlying per share in whole units, 1.0 when supply is 0
};

// Sample of a Totals snapshot
VaultMetric observe(const Totals& totals, uint8_t underlying_decimals, uint8_t decimals_offset,
                    uint64_t timestamp, uint64_t sequence);

struct PerformanceSummary {
    size_t samples = 0;
    uint64_t start_time = 0;
    uint64_t end_time = 0;
    double days = 0.0;

    double start_price = 0.0;
    double end_price = 0.0;
    double min_price = 0.0;
    double max_price = 0.0;

    double total_return = 0.0;          // (end - start) / start
    std::optional<double> apr;          // total_return / days * 365; absent over zero days

    double min_tvl = 0.0;
    double max_tvl = 0.0;
    std::optional<double> tvl_change;   // (max - min) / min over samples with tvl > 0
};

// =============================================================================
// MetricsHistory - ordered samples, deduplicated by sequence
// =============================================================================

class MetricsHistory {
public:
    // False if a sample with this sequence was already recorded
    bool record(const VaultMetric& metric);

    // Summary of samples with timestamp >= since; nullopt when there are none
    std::optional<PerformanceSummary> summarize(uint64_t since = 0) const;

    const std::vector<VaultMetric>& samples() const { return samples_; }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

private:
    std::vector<VaultMetric> samples_;   // sorted by (timestamp, sequence)
};

// =============================================================================
// JSON (amounts as decimal strings)
// =============================================================================

void to_json(nlohmann::json& j, const VaultMetric& metric);
void from_json(const nlohmann::json& j, VaultMetric& metric);
void to_json(nlohmann::json& j, const PerformanceSummary& summary);

} // namespace avault

#endif // AVAULT_METRICS_HPP
