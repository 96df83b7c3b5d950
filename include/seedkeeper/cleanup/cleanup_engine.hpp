#pragma once

#include "cleanup_rules.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace seedkeeper::cleanup {

enum class DeletionPhase {
    SELECTED,
    REANNOUNCE_REQUESTED,
    WAITING,
    DELETED,
    ABANDONED
};

const char* to_string(DeletionPhase phase);

struct PendingDeletion {
    std::string hash;
    std::string name;
    int tier = 0;               // 0 for manual requests
    std::string reason;         // "tier1".."tier3" or "manual"
    std::string detail;
    bool delete_files = false;
    bool reannounce_issued = false;
    std::chrono::system_clock::time_point requested_at;
    DeletionPhase phase = DeletionPhase::SELECTED;
    
    uint64_t total_size = 0;
    uint64_t uploaded = 0;
    uint64_t downloaded = 0;
};

std::string tier_reason(int tier);

// Picks at most one deletion candidate per evaluation: the first transfer,
// in snapshot order, matching the highest-priority tier that matches
// anything. Missing free space yields no candidate.
class CleanupEngine {
public:
    CleanupEngine(CleanupRules rules, bool delete_files);
    
    std::optional<PendingDeletion> evaluate(const std::vector<client::TransferSnapshot>& transfers,
                                            std::optional<uint64_t> free_space_bytes,
                                            const std::unordered_set<std::string>& protected_hashes) const;
    
    const CleanupRules& rules() const { return rules_; }
    bool delete_files() const { return delete_files_; }

private:
    CleanupRules rules_;
    bool delete_files_;
};

} // namespace seedkeeper::cleanup
