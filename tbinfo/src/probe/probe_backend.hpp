#pragma once

#include "probe_result.hpp"
#include "../rules/rules.hpp"

#include <optional>

namespace tbinfo {

// Tablebase probing capability. Results are from the point of view of the
// side to move in pos. Implementations must be safe to call concurrently.
class ProbeBackend {
public:
    virtual ~ProbeBackend() = default;

    // Returns true if tables are loaded and probing can succeed.
    virtual bool isAvailable() const noexcept = 0;

    // Per legal move results. Partial or empty when the tables have no data.
    virtual MoveProbes probe(const Position &pos) const = 0;

    // Result of the position itself, if available.
    virtual std::optional<ProbeResult> probeRoot(const Position &pos) const = 0;
};

} // namespace tbinfo
