#pragma once

#include "probe/probe_backend.hpp"
#include "rules/rules.hpp"

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tbinfo_test {

// Scripted position for FakeRules. The fen string is the lookup key.
struct FakePosition {
    tbinfo::Side turn = tbinfo::Side::White;
    bool legal = true;
    tbinfo::Terminal terminal = tbinfo::Terminal::None;
    std::string material = "KvK";
    std::vector<tbinfo::Move> moves;
};

class FakeRules : public tbinfo::Rules {
public:
    void add(const std::string &fen, FakePosition p) { positions_[fen] = std::move(p); }

    std::optional<tbinfo::Position> parse(const std::string &fen) const override {
        const auto it = positions_.find(fen);
        if (it == positions_.end()) return std::nullopt;
        return tbinfo::Position{fen, it->second.turn};
    }

    bool isLegal(const tbinfo::Position &pos) const override { return at(pos).legal; }

    std::vector<tbinfo::Move> legalMoves(const tbinfo::Position &pos) const override { return at(pos).moves; }

    tbinfo::Terminal terminalStatus(const tbinfo::Position &pos) const override { return at(pos).terminal; }

    std::string materialSignature(const tbinfo::Position &pos) const override { return at(pos).material; }

private:
    std::map<std::string, FakePosition> positions_;

    const FakePosition &at(const tbinfo::Position &pos) const { return positions_.at(pos.fen); }
};

class FakeProbe : public tbinfo::ProbeBackend {
public:
    bool available = true;
    std::map<std::string, tbinfo::MoveProbes> moves;
    std::map<std::string, tbinfo::ProbeResult> roots;
    mutable std::atomic<int> probeCalls{0};

    bool isAvailable() const noexcept override { return available; }

    tbinfo::MoveProbes probe(const tbinfo::Position &pos) const override {
        ++probeCalls;
        const auto it = moves.find(pos.fen);
        return it == moves.end() ? tbinfo::MoveProbes{} : it->second;
    }

    std::optional<tbinfo::ProbeResult> probeRoot(const tbinfo::Position &pos) const override {
        const auto it = roots.find(pos.fen);
        if (it == roots.end()) return std::nullopt;
        return it->second;
    }
};

inline tbinfo::Move makeMove(const std::string &uci, const std::string &san,
                             tbinfo::Terminal after = tbinfo::Terminal::None) {
    tbinfo::Move m;
    m.uci = uci;
    m.san = san;
    m.fen = "after-" + uci;
    m.after = after;
    return m;
}

} // namespace tbinfo_test
