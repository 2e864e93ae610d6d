#include "models.hpp"
#include "util.hpp"
#include <stdexcept>

std::string to_string(OptionType type) {
    return type == OptionType::Call ? "call" : "put";
}

std::string to_string(WyckoffEventType type) {
    switch (type) {
        case WyckoffEventType::SC: return "SC";
        case WyckoffEventType::AR: return "AR";
        case WyckoffEventType::AR_TOP: return "AR_TOP";
        case WyckoffEventType::SPRING: return "SPRING";
        case WyckoffEventType::UT: return "UT";
        case WyckoffEventType::SOS: return "SOS";
        case WyckoffEventType::BC: return "BC";
        case WyckoffEventType::SOW: return "SOW";
    }
    return "SC";
}

std::string to_string(Regime regime) {
    switch (regime) {
        case Regime::Accumulation: return "ACCUMULATION";
        case Regime::Markup: return "MARKUP";
        case Regime::Distribution: return "DISTRIBUTION";
        case Regime::Markdown: return "MARKDOWN";
        case Regime::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::optional<WyckoffEventType> event_type_from_string(const std::string& name) {
    static const WyckoffEventType all[] = {
        WyckoffEventType::SC, WyckoffEventType::AR, WyckoffEventType::AR_TOP,
        WyckoffEventType::SPRING, WyckoffEventType::UT, WyckoffEventType::SOS,
        WyckoffEventType::BC, WyckoffEventType::SOW
    };
    for (auto type : all) {
        if (to_string(type) == name) return type;
    }
    return std::nullopt;
}

std::optional<Regime> regime_from_string(const std::string& name) {
    static const Regime all[] = {
        Regime::Unknown, Regime::Accumulation, Regime::Markup,
        Regime::Distribution, Regime::Markdown
    };
    for (auto regime : all) {
        if (to_string(regime) == name) return regime;
    }
    return std::nullopt;
}

Regime regime_for_event(WyckoffEventType type) {
    switch (type) {
        case WyckoffEventType::SC:
        case WyckoffEventType::AR:
        case WyckoffEventType::AR_TOP:
        case WyckoffEventType::SPRING:
            return Regime::Accumulation;
        case WyckoffEventType::SOS:
            return Regime::Markup;
        case WyckoffEventType::UT:
        case WyckoffEventType::BC:
            return Regime::Distribution;
        case WyckoffEventType::SOW:
            return Regime::Markdown;
    }
    return Regime::Unknown;
}

nlohmann::json nullable_date(const std::optional<int>& day) {
    return day ? nlohmann::json(util::format_date(*day)) : nlohmann::json(nullptr);
}

nlohmann::json WyckoffEvent::to_json() const {
    return {
        {"symbol", symbol},
        {"date", util::format_date(day)},
        {"event_type", to_string(type)},
        {"confidence", confidence},
        {"price_level", price_level},
        {"volume_context", {
            {"volume", volume_context.volume},
            {"average_volume", volume_context.average_volume},
            {"volume_ratio", volume_context.volume_ratio}
        }},
        {"score", nullable(score)}
    };
}

WyckoffEvent WyckoffEvent::from_json(const nlohmann::json& j) {
    WyckoffEvent event;
    event.symbol = j.at("symbol").get<std::string>();

    auto day = util::parse_date(j.at("date").get<std::string>());
    if (!day) {
        throw std::runtime_error("Invalid event date: " + j.at("date").dump());
    }
    event.day = *day;

    auto type = event_type_from_string(j.at("event_type").get<std::string>());
    if (!type) {
        throw std::runtime_error("Unknown event type: " + j.at("event_type").dump());
    }
    event.type = *type;

    event.confidence = j.at("confidence").get<double>();
    event.price_level = j.at("price_level").get<double>();

    const auto& vc = j.at("volume_context");
    event.volume_context.volume = vc.at("volume").get<double>();
    event.volume_context.average_volume = vc.at("average_volume").get<double>();
    event.volume_context.volume_ratio = vc.at("volume_ratio").get<double>();

    if (j.contains("score") && !j["score"].is_null()) {
        event.score = j["score"].get<int>();
    }
    return event;
}
