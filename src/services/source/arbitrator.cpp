#include "listen_along/services/source/source_adapter.hpp"
#include "listen_along/utils/logger.hpp"

#include <algorithm>

namespace listen_along::services {

Arbitrator::Arbitrator(std::vector<std::shared_ptr<SourceAdapter>> adapters)
    : m_adapters(std::move(adapters)) {
    std::erase(m_adapters, nullptr);
    std::stable_sort(m_adapters.begin(), m_adapters.end(),
        [](const auto& a, const auto& b) { return a->source_id() < b->source_id(); });
}

std::optional<core::TrackSnapshot> Arbitrator::select() {
    for (const auto& adapter : m_adapters) {
        auto result = adapter->probe();
        if (!result) {
            LOG_DEBUG("Arbitrator", adapter->name() + " probe failed: " + core::to_string(result.error()));
            continue;
        }

        const auto& snapshot = *result;
        if (!snapshot) {
            continue;
        }
        if (!snapshot->is_playing) {
            LOG_DEBUG("Arbitrator", adapter->name() + " is paused, skipping");
            continue;
        }

        return *snapshot;
    }
    return std::nullopt;
}

} // namespace listen_along::services
