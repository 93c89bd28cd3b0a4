#include "report.hpp"

namespace tbinfo {

const char *categoryName(Category c) noexcept {
    switch (c) {
        case Category::Winning: return "winning";
        case Category::Cursed:  return "cursed";
        case Category::Drawing: return "drawing";
        case Category::Blessed: return "blessed";
        case Category::Losing:  return "losing";
        case Category::Unknown: return "unknown";
    }
    return "unknown";
}

const char *statusName(Status s) noexcept {
    switch (s) {
        case Status::Illegal:              return "illegal";
        case Status::InsufficientMaterial: return "insufficient-material";
        case Status::Checkmate:            return "checkmate";
        case Status::Stalemate:            return "stalemate";
        case Status::Win:                  return "win";
        case Status::Draw:                 return "draw";
        case Status::Loss:                 return "loss";
        case Status::CursedWin:            return "cursed-win";
        case Status::BlessedLoss:          return "blessed-loss";
        case Status::Unknown:              return "unknown";
    }
    return "unknown";
}

std::vector<RenderMove> &Report::movesIn(Category c) {
    switch (c) {
        case Category::Winning: return winningMoves;
        case Category::Cursed:  return cursedMoves;
        case Category::Drawing: return drawingMoves;
        case Category::Blessed: return blessedMoves;
        case Category::Losing:  return losingMoves;
        case Category::Unknown: break;
    }
    return unknownMoves;
}

const std::vector<RenderMove> &Report::movesIn(Category c) const {
    return const_cast<Report *>(this)->movesIn(c);
}

std::size_t Report::moveCount() const noexcept {
    return winningMoves.size() + cursedMoves.size() + drawingMoves.size() +
           blessedMoves.size() + losingMoves.size() + unknownMoves.size();
}

} // namespace tbinfo
