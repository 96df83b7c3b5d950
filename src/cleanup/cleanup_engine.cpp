#include "seedkeeper/cleanup/cleanup_engine.hpp"
#include "seedkeeper/core/logger.hpp"

namespace seedkeeper::cleanup {

const char* to_string(DeletionPhase phase) {
    switch (phase) {
        case DeletionPhase::SELECTED: return "selected";
        case DeletionPhase::REANNOUNCE_REQUESTED: return "reannounce_requested";
        case DeletionPhase::WAITING: return "waiting";
        case DeletionPhase::DELETED: return "deleted";
        case DeletionPhase::ABANDONED: return "abandoned";
    }
    return "selected";
}

std::string tier_reason(int tier) {
    return "tier" + std::to_string(tier);
}

CleanupEngine::CleanupEngine(CleanupRules rules, bool delete_files)
    : rules_(std::move(rules)), delete_files_(delete_files) {
}

std::optional<PendingDeletion> CleanupEngine::evaluate(
    const std::vector<client::TransferSnapshot>& transfers,
    std::optional<uint64_t> free_space_bytes,
    const std::unordered_set<std::string>& protected_hashes) const {
    
    if (!free_space_bytes) {
        LOG_DEBUG("Free space unknown, no cleanup candidate this cycle");
        return std::nullopt;
    }
    
    for (int ordinal : CleanupRules::PRIORITY) {
        for (const auto& transfer : transfers) {
            if (protected_hashes.count(transfer.hash) > 0 || !rules_.in_scope(transfer)) {
                continue;
            }
            
            auto matched = rules_.match(ordinal, transfer, *free_space_bytes);
            if (!matched) {
                continue;
            }
            
            PendingDeletion pending;
            pending.hash = transfer.hash;
            pending.name = transfer.name;
            pending.tier = matched->tier;
            pending.reason = tier_reason(matched->tier);
            pending.detail = std::move(matched->detail);
            pending.delete_files = delete_files_;
            pending.requested_at = std::chrono::system_clock::now();
            pending.total_size = transfer.total_size;
            pending.uploaded = transfer.uploaded;
            pending.downloaded = transfer.downloaded;
            return pending;
        }
    }
    return std::nullopt;
}

} // namespace seedkeeper::cleanup
