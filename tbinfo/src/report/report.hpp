#pragma once

#include "../rules/rules.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

// Category of a move from the point of view of the side playing it.
enum class Category { Winning, Cursed, Drawing, Blessed, Losing, Unknown };

enum class Status {
    Illegal,
    InsufficientMaterial,
    Checkmate,
    Stalemate,
    Win,
    Draw,
    Loss,
    CursedWin,
    BlessedLoss,
    Unknown,
};

const char *categoryName(Category c) noexcept;
const char *statusName(Status s) noexcept;

// Status of a position for the side to move. frustrated is set exactly for
// cursed wins and blessed losses.
struct PositionStatus {
    Status status = Status::Unknown;
    bool frustrated = false;
};

struct RenderMove {
    std::string uci;
    std::string san;
    std::string fen;            // position after the move
    std::optional<int> dtz;     // signed, only for decided categories and nonzero values
    Category category = Category::Unknown;
    Terminal after = Terminal::None;
    std::string badge;
};

// Everything known about one position. Move lists keep generation order.
struct Report {
    std::string fen;
    Side turn = Side::White;
    std::string material;            // as on the board, white first
    std::string normalizedMaterial;
    PositionStatus status;
    std::optional<Side> winningSide;
    std::string statusText;
    std::optional<int> dtz;          // of the position itself, if probed

    std::vector<RenderMove> winningMoves;
    std::vector<RenderMove> cursedMoves;
    std::vector<RenderMove> drawingMoves;
    std::vector<RenderMove> blessedMoves;
    std::vector<RenderMove> losingMoves;
    std::vector<RenderMove> unknownMoves;

    std::vector<RenderMove> &movesIn(Category c);
    const std::vector<RenderMove> &movesIn(Category c) const;
    std::size_t moveCount() const noexcept;
};

} // namespace tbinfo
