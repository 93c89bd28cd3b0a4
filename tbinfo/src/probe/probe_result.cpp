#include "probe_result.hpp"

#include <cstdlib>

namespace tbinfo {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::optional<ProbeResult> makeProbeResult(int wdl, std::optional<int> dtz) {
    if (wdl < -2 || wdl > 2) return std::nullopt;
    if (wdl == 0) return ProbeResult{Draw{}};

    std::optional<int> plies;
    if (dtz) plies = std::abs(*dtz);

    const bool frustrated = (plies && *plies != 0) ? dtzIsFrustrated(*plies) : (wdl == 1 || wdl == -1);
    if (wdl > 0) {
        if (frustrated) return ProbeResult{CursedWin{plies}};
        return ProbeResult{Win{plies}};
    }
    if (frustrated) return ProbeResult{BlessedLoss{plies}};
    return ProbeResult{Loss{plies}};
}

ProbeResult canonical(const ProbeResult &result) {
    // wdlOf() is always in range, so this never falls back.
    return makeProbeResult(wdlOf(result), dtzOf(result)).value_or(result);
}

int wdlOf(const ProbeResult &result) noexcept {
    return std::visit(Overloaded{
        [](const Win &) { return 2; },
        [](const CursedWin &) { return 1; },
        [](const Draw &) { return 0; },
        [](const BlessedLoss &) { return -1; },
        [](const Loss &) { return -2; },
    }, result);
}

std::optional<int> dtzOf(const ProbeResult &result) noexcept {
    return std::visit(Overloaded{
        [](const Win &r) -> std::optional<int> { return r.dtz; },
        [](const CursedWin &r) -> std::optional<int> { return r.dtz; },
        [](const Draw &) -> std::optional<int> { return 0; },
        [](const BlessedLoss &r) -> std::optional<int> {
            if (!r.dtz) return std::nullopt;
            return -*r.dtz;
        },
        [](const Loss &r) -> std::optional<int> {
            if (!r.dtz) return std::nullopt;
            return -*r.dtz;
        },
    }, result);
}

bool isFrustrated(const ProbeResult &result) noexcept {
    return std::holds_alternative<CursedWin>(result) || std::holds_alternative<BlessedLoss>(result);
}

DtzRange zeroingRange(int dtz) noexcept {
    const int n = std::abs(dtz);
    if (n == 0) return DtzRange{0, 0};
    return DtzRange{n, n + 1};
}

DtzRange laterPhaseRange(int dtz) noexcept {
    const int n = std::abs(dtz);
    return DtzRange{n - kFiftyMovePlies, n + 1 - kFiftyMovePlies};
}

} // namespace tbinfo
