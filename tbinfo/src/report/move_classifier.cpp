#include "move_classifier.hpp"

#include <cstdlib>

namespace tbinfo {

namespace {

std::string badgeFor(const RenderMove &m) {
    switch (m.after) {
        case Terminal::Checkmate:            return "Checkmate";
        case Terminal::Stalemate:            return "Stalemate";
        case Terminal::InsufficientMaterial: return "Insufficient material";
        case Terminal::None:                 break;
    }

    switch (m.category) {
        case Category::Unknown: return "Unknown";
        case Category::Drawing: return "Draw";
        case Category::Winning:
        case Category::Cursed:
            return m.dtz ? "Win with DTZ " + std::to_string(std::abs(*m.dtz)) : std::string("Win");
        case Category::Blessed:
        case Category::Losing:
            return m.dtz ? "Loss with DTZ " + std::to_string(std::abs(*m.dtz)) : std::string("Loss");
    }
    return "Unknown";
}

} // namespace

Category categoryOf(const std::optional<ProbeResult> &probe) noexcept {
    if (!probe) return Category::Unknown;
    switch (wdlOf(canonical(*probe))) {
        case 2:  return Category::Winning;
        case 1:  return Category::Cursed;
        case 0:  return Category::Drawing;
        case -1: return Category::Blessed;
        default: return Category::Losing;
    }
}

RenderMove classify(const Move &move, const std::optional<ProbeResult> &probe) {
    RenderMove out;
    out.uci = move.uci;
    out.san = move.san;
    out.fen = move.fen;
    out.after = move.after;
    out.category = categoryOf(probe);

    // DTZ 0 carries nothing worth showing.
    if (probe && out.category != Category::Drawing && out.category != Category::Unknown) {
        const auto dtz = dtzOf(*probe);
        if (dtz && *dtz != 0) out.dtz = dtz;
    }

    out.badge = badgeFor(out);
    return out;
}

} // namespace tbinfo
