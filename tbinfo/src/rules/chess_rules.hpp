#pragma once

#include "rules.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

// Rules implementation backed by chess-library. Every call works on its own
// board, so one instance can be shared between threads.
class ChessRules : public Rules {
public:
    // Accepts FEN or EPD (missing clocks default to "0 1"). Underscores are
    // read as spaces so URL-style FENs work too.
    std::optional<Position> parse(const std::string &fen) const override;

    bool isLegal(const Position &pos) const override;

    std::vector<Move> legalMoves(const Position &pos) const override;

    Terminal terminalStatus(const Position &pos) const override;

    std::string materialSignature(const Position &pos) const override;
};

} // namespace tbinfo
