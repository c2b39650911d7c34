#pragma once

#include "trellis/builder_config.hpp"
#include "trellis/graph.hpp"
#include "trellis/resource_cache.hpp"
#include "trellis/services.hpp"
#include "trellis/types.hpp"

#include <memory>
#include <vector>

namespace trellis {

// ============================================================================
// Builder
// ============================================================================

struct BuildResult {
    std::shared_ptr<const Graph> graph;
    std::vector<StatusRecord> statuses;  // one per Proxy, Route and Gateway, sorted by key
};

// Compiles one cache snapshot into a routing graph plus status records.
// A pure function of the snapshot, the resolver and the configuration.
class Builder {
public:
    explicit Builder(BuilderConfig config = get_default_builder_config());

    // Resolves services against the snapshot itself
    BuildResult build(const CacheSnapshot& snapshot) const;

    BuildResult build(const CacheSnapshot& snapshot, const ServiceResolver& resolver) const;

    const BuilderConfig& config() const { return config_; }

private:
    BuilderConfig config_;
};

} // namespace trellis
