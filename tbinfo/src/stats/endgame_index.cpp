#include "endgame_index.hpp"

#include "../material.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace tbinfo {

namespace {

constexpr int kPawnSplitPieces = 5;

const LongestEntry *longestOf(const EndgameData &data) {
    const LongestEntry *best = nullptr;
    for (const auto &entry : data.longest) {
        if (!best || entry.ply > best->ply) best = &entry;
    }
    return best;
}

} // namespace

std::vector<EndgameIndexGroup> endgameIndex(const StatsStore &store) {
    using GroupKey = std::pair<int, int>;   // pieces, pawns (-1 when not split)
    std::map<GroupKey, EndgameIndexGroup> groups;
    std::map<int, int> maxPly;

    for (const auto &key : store.keys()) {
        const EndgameData *data = store.find(key);
        const LongestEntry *longest = data ? longestOf(*data) : nullptr;
        if (!longest) continue;

        const int pieces = pieceCount(key);
        const int pawns = static_cast<int>(std::count(key.begin(), key.end(), 'P'));
        const GroupKey gk{pieces, pieces < kPawnSplitPieces ? -1 : pawns};

        EndgameIndexGroup &group = groups[gk];
        group.pieces = pieces;
        if (gk.second >= 0) group.pawns = gk.second;
        group.entries.push_back(EndgameIndexEntry{key, longest->epd, longest->ply, longest->wdl, false});

        auto it = maxPly.find(pieces);
        if (it == maxPly.end()) maxPly.emplace(pieces, longest->ply);
        else it->second = std::max(it->second, longest->ply);
    }

    std::vector<EndgameIndexGroup> out;
    out.reserve(groups.size());
    for (auto &kv : groups) {
        for (auto &entry : kv.second.entries) entry.maximal = entry.ply == maxPly[kv.second.pieces];
        out.push_back(std::move(kv.second));
    }
    return out;
}

} // namespace tbinfo
