#include "seedkeeper/cleanup/cleanup_rules.hpp"
#include "seedkeeper/core/utils.hpp"
#include <json/json.h>
#include <fmt/format.h>

namespace seedkeeper::cleanup {

using core::utils::StringUtils;

CleanupRules::CleanupRules(std::array<core::CleanupTier, 3> tiers, std::string tracker_keyword)
    : tiers_(tiers), tracker_keyword_(std::move(tracker_keyword)) {
}

CleanupRules CleanupRules::from_settings(const core::Settings& settings) {
    return CleanupRules(settings.cleanup_tiers, settings.cleanup_tracker_keyword);
}

bool CleanupRules::in_scope(const client::TransferSnapshot& transfer) const {
    if (tracker_keyword_.empty()) {
        return true;
    }
    return StringUtils::contains_ignore_case(transfer.tracker, tracker_keyword_);
}

std::optional<RuleMatch> CleanupRules::match(int ordinal,
                                             const client::TransferSnapshot& transfer,
                                             uint64_t free_space_bytes) const {
    const auto& rule = tier(ordinal);
    double free_gb = static_cast<double>(free_space_bytes) / BYTES_PER_GB;
    if (!(free_gb < rule.free_space_gb)) {
        return std::nullopt;
    }
    
    switch (client::classify(transfer)) {
        case client::TransferClass::UPLOAD: {
            if (!transfer.upload_rate) {
                return std::nullopt;
            }
            if (rule.upload_requires_completion && !transfer.is_complete()) {
                return std::nullopt;
            }
            double rate_kib = static_cast<double>(*transfer.upload_rate) / 1024.0;
            if (!(rate_kib < rule.upload_kib)) {
                return std::nullopt;
            }
            return RuleMatch{ordinal, fmt::format(
                "free space {:.1f}G<{}G{}, upload {}<{}",
                free_gb, rule.free_space_gb,
                rule.upload_requires_completion ? ", completed" : "",
                StringUtils::format_speed(static_cast<double>(*transfer.upload_rate)),
                StringUtils::format_speed(rule.upload_kib * 1024.0))};
        }
        
        case client::TransferClass::DOWNLOAD: {
            if (!transfer.download_rate) {
                return std::nullopt;
            }
            double rate_kib = static_cast<double>(*transfer.download_rate) / 1024.0;
            if (!(rate_kib < rule.download_kib)) {
                return std::nullopt;
            }
            return RuleMatch{ordinal, fmt::format(
                "free space {:.1f}G<{}G, download {}<{}",
                free_gb, rule.free_space_gb,
                StringUtils::format_speed(static_cast<double>(*transfer.download_rate)),
                StringUtils::format_speed(rule.download_kib * 1024.0))};
        }
        
        case client::TransferClass::WAITING:
        case client::TransferClass::IGNORED:
            break;
    }
    return std::nullopt;
}

std::string CleanupRules::serialize() const {
    Json::Value root(Json::objectValue);
    root["tracker_keyword"] = tracker_keyword_;
    
    Json::Value tiers(Json::arrayValue);
    for (const auto& rule : tiers_) {
        Json::Value entry(Json::objectValue);
        entry["tier"] = rule.ordinal;
        entry["free_space_gb"] = rule.free_space_gb;
        entry["upload_kib"] = rule.upload_kib;
        entry["download_kib"] = rule.download_kib;
        entry["upload_requires_completion"] = rule.upload_requires_completion;
        tiers.append(entry);
    }
    root["tiers"] = tiers;
    
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

} // namespace seedkeeper::cleanup
