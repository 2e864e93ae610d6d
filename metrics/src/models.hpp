#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class OptionType {
    Call,
    Put
};

struct OptionContract {
    double strike = 0.0;
    int expiry_day = 0;  // days since epoch
    OptionType type = OptionType::Call;
    std::optional<double> gamma;
    std::optional<double> delta;
    std::optional<double> implied_volatility;
    int64_t open_interest = 0;
    int64_t volume = 0;
    std::optional<double> bid;
    std::optional<double> ask;
};

struct OptionChainSnapshot {
    std::string symbol;
    int64_t snapshot_time_ms = 0;
    std::optional<int64_t> effective_options_time_ms;  // latest chain time <= snapshot
    int trading_day = 0;                               // reference date for DTE
    std::vector<OptionContract> contracts;
};

struct SpotResolution {
    std::optional<double> spot;
    std::optional<std::string> source;    // "override", "price_metrics.close", "ohlcv"
    std::optional<std::string> strategy;  // "override", "price_metrics", "ohlcv_fallback"
    std::vector<std::string> attempted_sources;
};

struct OHLCVBar {
    int day = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

enum class WyckoffEventType {
    SC,
    AR,
    AR_TOP,
    SPRING,
    UT,
    SOS,
    BC,
    SOW
};

enum class Regime {
    Unknown,
    Accumulation,
    Markup,
    Distribution,
    Markdown
};

std::string to_string(OptionType type);
std::string to_string(WyckoffEventType type);
std::string to_string(Regime regime);
std::optional<WyckoffEventType> event_type_from_string(const std::string& name);
std::optional<Regime> regime_from_string(const std::string& name);

// Fixed association between an event and the regime it belongs to
Regime regime_for_event(WyckoffEventType type);

struct VolumeContext {
    double volume = 0.0;
    double average_volume = 0.0;
    double volume_ratio = 0.0;
};

struct WyckoffEvent {
    std::string symbol;
    int day = 0;
    WyckoffEventType type = WyckoffEventType::SC;
    double confidence = 0.0;
    double price_level = 0.0;
    VolumeContext volume_context;
    std::optional<int> score;  // BC (0-28) and SPRING (0-12) only

    nlohmann::json to_json() const;
    static WyckoffEvent from_json(const nlohmann::json& j);
};

// Serialises an optional as an explicit null
template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json nullable_date(const std::optional<int>& day);
