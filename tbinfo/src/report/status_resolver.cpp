#include "status_resolver.hpp"

namespace tbinfo {

namespace {

// Higher is better for the side to move; -1 means no data.
int rank(Category c) noexcept {
    switch (c) {
        case Category::Winning: return 4;
        case Category::Cursed:  return 3;
        case Category::Drawing: return 2;
        case Category::Blessed: return 1;
        case Category::Losing:  return 0;
        case Category::Unknown: break;
    }
    return -1;
}

} // namespace

PositionStatus resolveStatus(bool legal, Terminal terminal, const std::vector<RenderMove> &classified) {
    if (!legal) return PositionStatus{Status::Illegal, false};

    switch (terminal) {
        case Terminal::InsufficientMaterial: return PositionStatus{Status::InsufficientMaterial, false};
        case Terminal::Checkmate:            return PositionStatus{Status::Checkmate, false};
        case Terminal::Stalemate:            return PositionStatus{Status::Stalemate, false};
        case Terminal::None:                 break;
    }

    int best = -1;
    for (const auto &m : classified) {
        const int r = rank(m.category);
        if (r > best) best = r;
    }

    switch (best) {
        case 4: return PositionStatus{Status::Win, false};
        case 3: return PositionStatus{Status::CursedWin, true};
        case 2: return PositionStatus{Status::Draw, false};
        case 1: return PositionStatus{Status::BlessedLoss, true};
        case 0: return PositionStatus{Status::Loss, false};
        default: return PositionStatus{Status::Unknown, false};
    }
}

std::optional<Side> winningSide(Status status, Side turn) noexcept {
    switch (status) {
        case Status::Win:
        case Status::CursedWin:
            return turn;
        case Status::Loss:
        case Status::BlessedLoss:
        case Status::Checkmate:
            return opposite(turn);
        default:
            return std::nullopt;
    }
}

std::string statusText(Status status, Side turn) {
    switch (status) {
        case Status::Illegal:              return "Invalid position";
        case Status::InsufficientMaterial: return "Draw by insufficient material";
        case Status::Checkmate:            return std::string(sideTitle(turn)) + " is checkmated";
        case Status::Stalemate:            return "Draw by stalemate";
        case Status::Draw:                 return "Draw";
        case Status::Unknown:              return "Position not found in tablebases";
        case Status::Win:
        case Status::Loss:
            return std::string(sideTitle(*winningSide(status, turn))) + " is winning";
        case Status::CursedWin:
        case Status::BlessedLoss:
            return std::string(sideTitle(*winningSide(status, turn))) + " is winning, but draw under 50-move rule";
    }
    return "Position not found in tablebases";
}

} // namespace tbinfo
