#pragma once

#include "stats_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

// Longest known position of one endgame.
struct EndgameIndexEntry {
    std::string material;
    std::string epd;
    int ply = 0;
    int wdl = 0;
    bool maximal = false;   // no endgame with as many pieces is longer
};

// Endgames sharing a piece count. From five pieces on they are further split
// by pawn count; smaller endgames form one group with no pawn count.
struct EndgameIndexGroup {
    int pieces = 0;
    std::optional<int> pawns;
    std::vector<EndgameIndexEntry> entries;
};

// Groups ordered by pieces, then pawns; entries by material key. Endgames
// without a longest example are left out.
std::vector<EndgameIndexGroup> endgameIndex(const StatsStore &store);

} // namespace tbinfo
