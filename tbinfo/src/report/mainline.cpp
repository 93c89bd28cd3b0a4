#include "mainline.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace tbinfo {

namespace {

constexpr Category kPreference[] = {
    Category::Winning, Category::Cursed, Category::Drawing, Category::Blessed, Category::Losing,
};

constexpr int kFiftyMoveClock = 100;

int distance(const RenderMove &m) {
    return m.dtz ? std::abs(*m.dtz) : 0;
}

// Captures and pawn moves reset the fifty-move counter.
bool isZeroing(const std::string &san) {
    if (san.empty()) return false;
    return san.find('x') != std::string::npos || (san[0] >= 'a' && san[0] <= 'h');
}

// Fullmove number from the last FEN field, 1 if absent.
int fullmoveOf(const std::string &fen) {
    const auto sp = fen.find_last_of(' ');
    const std::string tail = sp == std::string::npos ? fen : fen.substr(sp + 1);
    if (tail.empty() || tail.size() > 6 ||
        !std::all_of(tail.begin(), tail.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return 1;
    }
    return std::max(1, std::stoi(tail));
}

const char *winnerResult(Side winner) noexcept {
    return winner == Side::White ? "1-0" : "0-1";
}

} // namespace

std::optional<RenderMove> bestMove(const Report &report) {
    for (Category c : kPreference) {
        for (const auto &m : report.movesIn(c)) {
            if (m.after == Terminal::Checkmate) return m;
        }
    }
    for (const auto &m : report.unknownMoves) {
        if (m.after == Terminal::Checkmate) return m;
    }
    for (Category c : kPreference) {
        const auto &moves = report.movesIn(c);
        if (moves.empty()) continue;
        const bool winning = c == Category::Winning || c == Category::Cursed;
        const bool losing = c == Category::Blessed || c == Category::Losing;
        auto best = moves.begin();
        for (auto it = moves.begin(); it != moves.end(); ++it) {
            if (winning && distance(*it) < distance(*best)) best = it;
            if (losing && distance(*it) > distance(*best)) best = it;
        }
        return *best;
    }
    return std::nullopt;
}

std::optional<Mainline> dtzMainline(const PositionAnalyzer &analyzer, const std::string &fen, int maxPlies) {
    Report report = analyzer.analyze(fen);
    if (report.status.status == Status::Illegal) return std::nullopt;

    Mainline line;
    line.fen = report.fen;
    line.material = report.normalizedMaterial;

    int clock = 0;
    for (;;) {
        switch (report.status.status) {
            case Status::Checkmate:
                line.result = winnerResult(opposite(report.turn));
                line.termination = "checkmate";
                return line;
            case Status::Stalemate:
                line.result = "1/2-1/2";
                line.termination = "stalemate";
                return line;
            case Status::InsufficientMaterial:
                line.result = "1/2-1/2";
                line.termination = "insufficient material";
                return line;
            default:
                break;
        }
        if (clock >= kFiftyMoveClock) {
            line.result = "1/2-1/2";
            line.termination = "fifty-move rule";
            return line;
        }
        if (static_cast<int>(line.moves.size()) >= maxPlies) {
            line.result = "*";
            line.termination = "move limit";
            return line;
        }

        const auto move = bestMove(report);
        if (!move) {
            line.result = "*";
            line.termination = "no tablebase data";
            return line;
        }
        line.moves.push_back(move->san);
        clock = isZeroing(move->san) ? 0 : clock + 1;
        report = analyzer.analyze(move->fen);
        if (report.status.status == Status::Illegal) {
            line.result = "*";
            line.termination = "no tablebase data";
            return line;
        }
    }
}

std::string mainlinePgn(const Mainline &line) {
    std::ostringstream oss;
    oss << "[Event \"DTZ mainline\"]\n";
    oss << "[Site \"tbinfo\"]\n";
    oss << "[Result \"" << line.result << "\"]\n";
    oss << "[FEN \"" << line.fen << "\"]\n";
    oss << "[SetUp \"1\"]\n";
    oss << "[Termination \"" << line.termination << "\"]\n\n";

    const auto sp = line.fen.find(' ');
    const bool blackFirst = sp != std::string::npos && line.fen.compare(sp + 1, 1, "b") == 0;
    int number = fullmoveOf(line.fen);
    bool white = !blackFirst;

    std::vector<std::string> tokens;
    for (std::size_t i = 0; i < line.moves.size(); ++i) {
        if (white) tokens.push_back(std::to_string(number) + ".");
        else if (i == 0) tokens.push_back(std::to_string(number) + "...");
        tokens.push_back(line.moves[i]);
        if (!white) ++number;
        white = !white;
    }
    tokens.push_back(line.result);

    std::size_t col = 0;
    for (const auto &tok : tokens) {
        if (col > 0 && col + 1 + tok.size() > 80) {
            oss << '\n';
            col = 0;
        }
        if (col > 0) {
            oss << ' ';
            ++col;
        }
        oss << tok;
        col += tok.size();
    }
    oss << "\n";
    return oss.str();
}

} // namespace tbinfo
