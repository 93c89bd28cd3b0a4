#pragma once

#include "report.hpp"
#include "../probe/probe_result.hpp"

#include <optional>

namespace tbinfo {

// Category for a probe result; std::nullopt (no data) is always Unknown.
// Results are canonicalized first, so the DTZ magnitude wins over the tag.
Category categoryOf(const std::optional<ProbeResult> &probe) noexcept;

RenderMove classify(const Move &move, const std::optional<ProbeResult> &probe);

} // namespace tbinfo
