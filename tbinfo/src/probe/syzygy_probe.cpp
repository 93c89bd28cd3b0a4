#include "syzygy_probe.hpp"

#include "chess.hpp"

#include <tbprobe.h>

#include <iostream>

namespace tbinfo::syzygy {

namespace {

// Bitboards in the layout Fathom expects.
struct TbPositionParts {
    uint64_t white = 0, black = 0;
    uint64_t kings = 0, queens = 0, rooks = 0, bishops = 0, knights = 0, pawns = 0;
    unsigned ep = 0;  // 0 if none
    bool whiteToMove = true;
};

TbPositionParts extractParts(const chess::Board &b) {
    TbPositionParts p;
    p.white   = b.us(chess::Color::WHITE).getBits();
    p.black   = b.us(chess::Color::BLACK).getBits();
    p.kings   = b.pieces(chess::PieceType::KING).getBits();
    p.queens  = b.pieces(chess::PieceType::QUEEN).getBits();
    p.rooks   = b.pieces(chess::PieceType::ROOK).getBits();
    p.bishops = b.pieces(chess::PieceType::BISHOP).getBits();
    p.knights = b.pieces(chess::PieceType::KNIGHT).getBits();
    p.pawns   = b.pieces(chess::PieceType::PAWN).getBits();
    p.ep = (b.enpassantSq() == chess::Square::NO_SQ)
        ? 0u
        : static_cast<unsigned>(b.enpassantSq().index());
    p.whiteToMove = (b.sideToMove() == chess::Color::WHITE);
    return p;
}

// Rebuilds the library move from a Fathom result so it can be printed as UCI.
chess::Move decodeMove(unsigned res) {
    const int from = static_cast<int>(TB_GET_FROM(res));
    const int to   = static_cast<int>(TB_GET_TO(res));
    const int prm  = static_cast<int>(TB_GET_PROMOTES(res));

    if (TB_GET_EP(res) != 0) {
        return chess::Move::make<chess::Move::ENPASSANT>(static_cast<chess::Square>(from), static_cast<chess::Square>(to));
    }

    if (prm != TB_PROMOTES_NONE) {
        chess::PieceType::underlying promo_pt = chess::PieceType::QUEEN;
        if (prm == TB_PROMOTES_ROOK) promo_pt = chess::PieceType::ROOK;
        else if (prm == TB_PROMOTES_BISHOP) promo_pt = chess::PieceType::BISHOP;
        else if (prm == TB_PROMOTES_KNIGHT) promo_pt = chess::PieceType::KNIGHT;
        return chess::Move::make<chess::Move::PROMOTION>(static_cast<chess::Square>(from), static_cast<chess::Square>(to), promo_pt);
    }

    return chess::Move::make<chess::Move::NORMAL>(static_cast<chess::Square>(from), static_cast<chess::Square>(to));
}

// Fathom encodes WDL as TB_LOSS (0) .. TB_WIN (4).
std::optional<ProbeResult> decodeResult(unsigned res) {
    const int wdl = static_cast<int>(TB_GET_WDL(res)) - 2;
    const int dtz = static_cast<int>(TB_GET_DTZ(res));
    return makeProbeResult(wdl, dtz);
}

} // namespace

SyzygyProbe::SyzygyProbe(const std::string &tbPath) : tbPath_(tbPath) {
    if (tbPath_.empty()) {
        available_ = false;
        return;
    }
    if (!tb_init(tbPath_.c_str())) {
        std::cerr << "[SyzygyProbe] tb_init failed for " << tbPath_ << '\n';
        available_ = false;
        return;
    }
    largest_ = TB_LARGEST;
    available_ = largest_ > 0;
    if (!available_) {
        std::cerr << "[SyzygyProbe] no tables found in " << tbPath_ << '\n';
    }
}

SyzygyProbe::~SyzygyProbe() {
    if (available_) tb_free();
}

bool SyzygyProbe::isAvailable() const noexcept { return available_; }

std::optional<SyzygyProbe::RootProbe> SyzygyProbe::probeRootImpl(const Position &pos) const {
    if (!available_) return std::nullopt;

    chess::Board board;
    board.setFen(pos.fen);

    const unsigned piece_count = static_cast<unsigned>(board.occ().count());
    if (piece_count > largest_) return std::nullopt;

    // Skip probing if any castling rights are available; TBs don't account for castling
    if (!board.castlingRights().isEmpty()) return std::nullopt;

    const TbPositionParts p = extractParts(board);

    RootProbe out;
    out.moves.assign(TB_MAX_MOVES, TB_RESULT_FAILED);

    // The halfmove clock is passed as 0 so results are the plain DTZ50''
    // values of the tables, independent of the game history.
    {
        std::lock_guard<std::mutex> lock(probeMutex_);
        out.root = tb_probe_root(p.white, p.black, p.kings, p.queens, p.rooks,
                                 p.bishops, p.knights, p.pawns,
                                 0u, 0u, p.ep, p.whiteToMove, out.moves.data());
    }

    if (out.root == TB_RESULT_FAILED) return std::nullopt;
    return out;
}

MoveProbes SyzygyProbe::probe(const Position &pos) const {
    MoveProbes probes;
    const auto root = probeRootImpl(pos);
    if (!root) return probes;
    if (root->root == TB_RESULT_CHECKMATE || root->root == TB_RESULT_STALEMATE) return probes;

    for (unsigned res : root->moves) {
        if (res == TB_RESULT_FAILED) break;
        auto result = decodeResult(res);
        if (!result) continue;
        probes.emplace(chess::uci::moveToUci(decodeMove(res)), *result);
    }
    return probes;
}

std::optional<ProbeResult> SyzygyProbe::probeRoot(const Position &pos) const {
    const auto root = probeRootImpl(pos);
    if (!root) return std::nullopt;
    if (root->root == TB_RESULT_CHECKMATE) return ProbeResult{Loss{0}};
    if (root->root == TB_RESULT_STALEMATE) return ProbeResult{Draw{}};
    return decodeResult(root->root);
}

} // namespace tbinfo::syzygy
