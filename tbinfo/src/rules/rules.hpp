#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

enum class Side { White, Black };

inline Side opposite(Side s) noexcept { return s == Side::White ? Side::Black : Side::White; }

inline const char *sideName(Side s) noexcept { return s == Side::White ? "white" : "black"; }

// Capitalized for sentences ("White is winning").
inline const char *sideTitle(Side s) noexcept { return s == Side::White ? "White" : "Black"; }

enum class Terminal { None, Checkmate, Stalemate, InsufficientMaterial };

// Snapshot of a parsed position. Only the rules implementation interprets fen.
struct Position {
    std::string fen;
    Side turn = Side::White;
};

// One legal move and the position it leads to.
struct Move {
    std::string uci;
    std::string san;
    std::string fen;
    Terminal after = Terminal::None;
};

// Chess rules capability consumed by the analyzer. Implementations must be
// safe to call concurrently from several threads.
class Rules {
public:
    virtual ~Rules() = default;

    // Returns std::nullopt if the text cannot be read as a position at all.
    virtual std::optional<Position> parse(const std::string &fen) const = 0;

    virtual bool isLegal(const Position &pos) const = 0;

    // Legal moves in generation order.
    virtual std::vector<Move> legalMoves(const Position &pos) const = 0;

    virtual Terminal terminalStatus(const Position &pos) const = 0;

    // Piece letters per side, white first, e.g. "KNNvKRN". Not normalized.
    virtual std::string materialSignature(const Position &pos) const = 0;
};

} // namespace tbinfo
