#pragma once

#include "listen_along/core/models.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace listen_along::services {

// One track source. probe() returns nullopt when nothing is playing and an
// error only when the source itself could not be read.
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    virtual std::expected<std::optional<core::TrackSnapshot>, core::AdapterProbeError> probe() = 0;

    virtual std::string name() const = 0;
    virtual core::SourceId source_id() const = 0;
};

/**
 * @brief Picks the single authoritative track for a tick.
 *
 * Adapters are probed in SourceId order (PrimarySource first). The first
 * snapshot that is playing wins. An adapter error counts as "nothing from
 * this adapter" and the next one is tried.
 */
class Arbitrator {
public:
    explicit Arbitrator(std::vector<std::shared_ptr<SourceAdapter>> adapters);

    std::optional<core::TrackSnapshot> select();

    std::size_t adapter_count() const { return m_adapters.size(); }

private:
    std::vector<std::shared_ptr<SourceAdapter>> m_adapters;
};

} // namespace listen_along::services
