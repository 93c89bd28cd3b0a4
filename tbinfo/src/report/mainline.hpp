#pragma once

#include "position_analyzer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

// A game played out by both sides following the tablebase.
struct Mainline {
    std::string fen;                // start position
    std::string material;           // normalized
    std::vector<std::string> moves; // SAN
    std::string result;             // "1-0", "0-1", "1/2-1/2" or "*"
    std::string termination;
};

// Picks the move a tablebase-perfect player makes: mate if available, else the
// best category, the fastest DTZ when winning and the slowest when losing.
// std::nullopt when no move has probe data.
std::optional<RenderMove> bestMove(const Report &report);

// Plays bestMove() from fen until mate, a draw by rule or missing data, or
// maxPlies moves. std::nullopt if the start position is illegal.
std::optional<Mainline> dtzMainline(const PositionAnalyzer &analyzer, const std::string &fen,
                                    int maxPlies = 1000);

// PGN text with FEN/SetUp headers, movetext wrapped at 80 columns.
std::string mainlinePgn(const Mainline &line);

} // namespace tbinfo
