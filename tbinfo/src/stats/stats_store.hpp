#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tbinfo {

// Unique position counts of one endgame. "white" is the side listed first in
// the canonical key.
struct WdlCounts {
    std::uint64_t white = 0;
    std::uint64_t cursed = 0;
    std::uint64_t draws = 0;
    std::uint64_t blessed = 0;
    std::uint64_t black = 0;

    std::uint64_t sum() const noexcept { return white + cursed + draws + blessed + black; }
};

// A long example position. wdl is from the side to move in epd.
struct LongestEntry {
    std::string epd;
    int ply = 0;
    int wdl = 0;
};

// Position counts by DTZ ply for one side to move.
struct SideHistogram {
    std::vector<std::uint64_t> win;
    std::vector<std::uint64_t> loss;
};

struct EndgameData {
    WdlCounts counts;
    std::uint64_t total = 0;
    std::vector<LongestEntry> longest;
    std::optional<SideHistogram> white;
    std::optional<SideHistogram> black;
    std::optional<std::uint64_t> wdlBytes;   // .rtbw file size
    std::optional<std::uint64_t> dtzBytes;   // .rtbz file size
};

// Read-only set of precomputed endgame statistics, keyed by canonical
// material. Built once, then shared by reference.
class StatsStore {
public:
    StatsStore() = default;

    // Parses the line format:
    //   endgame KRNvKNN
    //   total 4455813974
    //   counts <white> <cursed> <draws> <blessed> <black>
    //   longest <ply> <wdl> <epd...>
    //   histogram <white|black> <win|loss> <n0> <n1> ...
    //   files <rtbw bytes> <rtbz bytes>
    //   end
    // Blank lines and '#' comments are skipped. Returns std::nullopt and logs
    // the offending line on malformed input.
    static std::optional<StatsStore> load(std::istream &in);
    static std::optional<StatsStore> loadFile(const std::string &path);

    // Adds or replaces an endgame. Returns false if key is not a canonical
    // material key.
    bool add(const std::string &key, EndgameData data);

    const EndgameData *find(const std::string &key) const;

    std::vector<std::string> keys() const;
    std::size_t size() const noexcept { return endgames_.size(); }
    bool empty() const noexcept { return endgames_.empty(); }

private:
    std::map<std::string, EndgameData> endgames_;
};

} // namespace tbinfo
