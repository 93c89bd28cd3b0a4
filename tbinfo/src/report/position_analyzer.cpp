#include "position_analyzer.hpp"

#include "move_classifier.hpp"
#include "status_resolver.hpp"
#include "../material.hpp"

#include <optional>

namespace tbinfo {

namespace {

void finish(Report &report) {
    report.winningSide = winningSide(report.status.status, report.turn);
    report.statusText = statusText(report.status.status, report.turn);
}

bool isTableStatus(Status s) noexcept {
    return s == Status::Win || s == Status::CursedWin || s == Status::Draw ||
           s == Status::BlessedLoss || s == Status::Loss;
}

} // namespace

Report PositionAnalyzer::analyze(const std::string &fen) const {
    const auto pos = rules_.parse(fen);
    if (!pos) {
        Report report;
        report.fen = fen;
        report.status = PositionStatus{Status::Illegal, false};
        finish(report);
        return report;
    }
    return analyze(*pos);
}

Report PositionAnalyzer::analyze(const Position &pos) const {
    Report report;
    report.fen = pos.fen;
    report.turn = pos.turn;
    report.material = rules_.materialSignature(pos);
    report.normalizedMaterial = normalizeMaterial(report.material);

    const bool legal = rules_.isLegal(pos);
    if (!legal) {
        report.status = resolveStatus(false, Terminal::None, {});
        finish(report);
        return report;
    }

    const Terminal terminal = rules_.terminalStatus(pos);

    std::vector<RenderMove> classified;
    if (terminal != Terminal::Checkmate && terminal != Terminal::Stalemate) {
        const std::vector<Move> moves = rules_.legalMoves(pos);
        const MoveProbes probes = probe_.isAvailable() ? probe_.probe(pos) : MoveProbes{};

        classified.reserve(moves.size());
        for (const auto &m : moves) {
            const auto it = probes.find(m.uci);
            const std::optional<ProbeResult> result =
                it == probes.end() ? std::nullopt : std::optional<ProbeResult>(it->second);
            classified.push_back(classify(m, result));
        }
    }

    report.status = resolveStatus(true, terminal, classified);

    if (isTableStatus(report.status.status) && probe_.isAvailable()) {
        if (const auto root = probe_.probeRoot(pos)) report.dtz = dtzOf(*root);
    }

    for (auto &m : classified) {
        report.movesIn(m.category).push_back(std::move(m));
    }

    finish(report);
    return report;
}

} // namespace tbinfo
