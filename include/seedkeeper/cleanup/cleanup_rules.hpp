#pragma once

#include "seedkeeper/client/transfer_snapshot.hpp"
#include "seedkeeper/core/settings.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace seedkeeper::cleanup {

struct RuleMatch {
    int tier = 0;
    std::string detail;
};

// Tiered free-space/throughput predicates. Evaluation order is 3, 1, 2:
// tier 3 is the emergency rule with the lowest space threshold.
class CleanupRules {
public:
    static constexpr std::array<int, 3> PRIORITY = {3, 1, 2};
    static constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;
    
    CleanupRules(std::array<core::CleanupTier, 3> tiers, std::string tracker_keyword);
    
    static CleanupRules from_settings(const core::Settings& settings);
    
    // Empty keyword puts every transfer in scope.
    bool in_scope(const client::TransferSnapshot& transfer) const;
    
    // Waiting, ignored and unsampled transfers never match.
    std::optional<RuleMatch> match(int ordinal,
                                   const client::TransferSnapshot& transfer,
                                   uint64_t free_space_bytes) const;
    
    const core::CleanupTier& tier(int ordinal) const { return tiers_.at(ordinal - 1); }
    const std::string& tracker_keyword() const { return tracker_keyword_; }
    
    // JSON rendering recorded in the rule snapshot audit trail.
    std::string serialize() const;

private:
    std::array<core::CleanupTier, 3> tiers_;
    std::string tracker_keyword_;
};

} // namespace seedkeeper::cleanup
