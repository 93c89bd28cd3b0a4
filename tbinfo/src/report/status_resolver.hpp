#pragma once

#include "report.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

// Resolves the status of a position in priority order: illegal, insufficient
// material, checkmate/stalemate, then the best move category for the side to
// move. Positions without any probed move are Unknown.
PositionStatus resolveStatus(bool legal, Terminal terminal, const std::vector<RenderMove> &classified);

// Side that wins (in practice or only without the fifty-move rule), if any.
std::optional<Side> winningSide(Status status, Side turn) noexcept;

std::string statusText(Status status, Side turn);

} // namespace tbinfo
