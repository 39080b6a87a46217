// =============================================================================
// metrics.cpp - TVL / Share Price History
// =============================================================================

#include "avault/metrics.hpp"
#include "avault/math.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace avault {

using json = nlohmann::json;

namespace {

constexpr double SECONDS_PER_DAY = 86400.0;

}  // namespace

VaultMetric observe(const Totals& totals, uint8_t underlying_decimals, uint8_t decimals_offset,
                    uint64_t timestamp, uint64_t sequence) {
    VaultMetric metric;
    metric.timestamp = timestamp;
    metric.sequence = sequence;
    metric.total_assets = totals.total_assets;
    metric.total_supply = totals.total_supply;

    metric.tvl = static_cast<double>(totals.total_assets) / std::pow(10.0, underlying_decimals);
    if (totals.total_supply > 0) {
        // Shares carry decimals_offset more decimals than the underlying
        metric.share_price = static_cast<double>(totals.total_assets)
                           / static_cast<double>(totals.total_supply)
                           * std::pow(10.0, decimals_offset);
    } else {
        metric.share_price = 1.0;
    }
    return metric;
}

// =============================================================================
// MetricsHistory
// =============================================================================

bool MetricsHistory::record(const VaultMetric& metric) {
    for (const auto& existing : samples_) {
        if (existing.sequence == metric.sequence) return false;
    }

    auto pos = std::upper_bound(samples_.begin(), samples_.end(), metric,
        [](const VaultMetric& a, const VaultMetric& b) {
            return a.timestamp < b.timestamp
                || (a.timestamp == b.timestamp && a.sequence < b.sequence);
        });
    samples_.insert(pos, metric);
    return true;
}

std::optional<PerformanceSummary> MetricsHistory::summarize(uint64_t since) const {
    auto first = std::find_if(samples_.begin(), samples_.end(),
                              [since](const VaultMetric& m) { return m.timestamp >= since; });
    if (first == samples_.end()) return std::nullopt;

    PerformanceSummary s;
    s.start_time = first->timestamp;
    s.start_price = first->share_price;
    s.min_price = first->share_price;
    s.max_price = first->share_price;

    bool have_tvl = false;
    for (auto it = first; it != samples_.end(); ++it) {
        ++s.samples;
        s.end_time = it->timestamp;
        s.end_price = it->share_price;
        s.min_price = std::min(s.min_price, it->share_price);
        s.max_price = std::max(s.max_price, it->share_price);

        if (it->tvl > 0.0) {
            s.min_tvl = have_tvl ? std::min(s.min_tvl, it->tvl) : it->tvl;
            s.max_tvl = have_tvl ? std::max(s.max_tvl, it->tvl) : it->tvl;
            have_tvl = true;
        }
    }

    s.days = static_cast<double>(s.end_time - s.start_time) / SECONDS_PER_DAY;
    if (s.start_price > 0.0) {
        s.total_return = (s.end_price - s.start_price) / s.start_price;
    }
    if (s.days > 0.0) {
        s.apr = s.total_return / s.days * 365.0;
    }
    if (have_tvl) {
        s.tvl_change = (s.max_tvl - s.min_tvl) / s.min_tvl;
    }
    return s;
}

// =============================================================================
// JSON
// =============================================================================

void to_json(json& j, const VaultMetric& metric) {
    j = json{
        {"timestamp", metric.timestamp},
        {"sequence", metric.sequence},
        {"total_assets", math::to_string(metric.total_assets)},
        {"total_supply", math::to_string(metric.total_supply)},
        {"tvl", metric.tvl},
        {"share_price", metric.share_price}
    };
}

void from_json(const json& j, VaultMetric& metric) {
    metric.timestamp = j.at("timestamp").get<uint64_t>();
    metric.sequence = j.value("sequence", uint64_t(0));
    metric.total_assets = math::parse_u128(j.at("total_assets").get<std::string>());
    metric.total_supply = math::parse_u128(j.at("total_supply").get<std::string>());
    metric.tvl = j.value("tvl", 0.0);
    metric.share_price = j.value("share_price", 1.0);
}

void to_json(json& j, const PerformanceSummary& summary) {
    j = json{
        {"samples", summary.samples},
        {"start_time", summary.start_time},
        {"end_time", summary.end_time},
        {"days", summary.days},
        {"start_price", summary.start_price},
        {"end_price", summary.end_price},
        {"min_price", summary.min_price},
        {"max_price", summary.max_price},
        {"total_return", summary.total_return},
        {"min_tvl", summary.min_tvl},
        {"max_tvl", summary.max_tvl}
    };
    j["apr"] = summary.apr ? json(*summary.apr) : json(nullptr);
    j["tvl_change"] = summary.tvl_change ? json(*summary.tvl_change) : json(nullptr);
}

} // namespace avault
