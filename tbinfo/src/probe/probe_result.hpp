#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace tbinfo {

// Distance to zeroing beyond which a result no longer counts under the
// fifty-move rule.
inline constexpr int kFiftyMovePlies = 100;

// Outcome of a move (or position) from the point of view of the side that
// plays it. Non-draw results carry the unsigned DTZ in plies when known.
struct Win { std::optional<int> dtz; };
struct CursedWin { std::optional<int> dtz; };
struct Draw {};
struct BlessedLoss { std::optional<int> dtz; };
struct Loss { std::optional<int> dtz; };

using ProbeResult = std::variant<Win, CursedWin, Draw, BlessedLoss, Loss>;

// Probe data per legal move, keyed by UCI. Missing keys mean "no data".
using MoveProbes = std::unordered_map<std::string, ProbeResult>;

// Builds a result from the 5-valued scale (+2 win, +1 cursed win, 0 draw,
// -1 blessed loss, -2 loss) and a DTZ. A nonzero DTZ decides frustration by
// its magnitude, the WDL decides the sign. Returns std::nullopt if wdl is out
// of range.
std::optional<ProbeResult> makeProbeResult(int wdl, std::optional<int> dtz);

// Re-applies the DTZ rules, so a Win carrying DTZ 150 becomes a CursedWin.
ProbeResult canonical(const ProbeResult &result);

// +2..-2
int wdlOf(const ProbeResult &result) noexcept;

// Signed DTZ: positive when winning, negative when losing, 0 for draws.
std::optional<int> dtzOf(const ProbeResult &result) noexcept;

bool isFrustrated(const ProbeResult &result) noexcept;

// True when |dtz| is past the fifty-move threshold.
inline bool dtzIsFrustrated(int dtz) noexcept {
    return dtz > kFiftyMovePlies || dtz < -kFiftyMovePlies;
}

// Plies until a zeroing move or mate can be forced. Some tables store
// rounded values, so the true distance is either low or high. A frustrated
// DTZ also yields the distance in the later phase that causes the draw.
struct DtzRange {
    int low = 0;
    int high = 0;
};

DtzRange zeroingRange(int dtz) noexcept;

// Only meaningful when dtzIsFrustrated(dtz).
DtzRange laterPhaseRange(int dtz) noexcept;

} // namespace tbinfo
