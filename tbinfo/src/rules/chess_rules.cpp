#include "chess_rules.hpp"

#include "../material.hpp"

#include "chess.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string_view>

namespace tbinfo {

namespace {

std::vector<std::string> split(const std::string &line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

bool validBoardField(const std::string &field) {
    int ranks = 1;
    int files = 0;
    for (char c : field) {
        if (c == '/') {
            if (files != 8) return false;
            ++ranks;
            files = 0;
        } else if (c >= '1' && c <= '8') {
            files += c - '0';
        } else if (std::string_view("pnbrqkPNBRQK").find(c) != std::string_view::npos) {
            ++files;
        } else {
            return false;
        }
        if (files > 8) return false;
    }
    return ranks == 8 && files == 8;
}

bool validCastlingField(const std::string &field) {
    if (field == "-") return true;
    return !field.empty() && std::all_of(field.begin(), field.end(), [](char c) {
        return std::string_view("KQkqABCDEFGHabcdefgh").find(c) != std::string_view::npos;
    });
}

bool validEpField(const std::string &field) {
    if (field == "-") return true;
    return field.size() == 2 && field[0] >= 'a' && field[0] <= 'h' && (field[1] == '3' || field[1] == '6');
}

bool validCounter(const std::string &field) {
    return !field.empty() && std::all_of(field.begin(), field.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

chess::Board makeBoard(const Position &pos) {
    chess::Board board;
    board.setFen(pos.fen);
    return board;
}

Terminal terminalOf(const chess::Board &board) {
    if (board.isInsufficientMaterial()) return Terminal::InsufficientMaterial;
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    if (!moves.empty()) return Terminal::None;
    return board.inCheck() ? Terminal::Checkmate : Terminal::Stalemate;
}

// Squares a1..h8 of a validated placement field, '.' for empty.
std::array<char, 64> placementOf(const std::string &field) {
    std::array<char, 64> squares;
    squares.fill('.');
    int rank = 7;
    int file = 0;
    for (char c : field) {
        if (c == '/') {
            --rank;
            file = 0;
        } else if (c >= '1' && c <= '8') {
            file += c - '0';
        } else {
            squares[static_cast<std::size_t>(rank * 8 + file)] = c;
            ++file;
        }
    }
    return squares;
}

char pieceAt(const std::array<char, 64> &squares, int file, int rank) {
    return squares[static_cast<std::size_t>(rank * 8 + file)];
}

// Every castling right needs its king and rook on their home squares. Files
// A-H name the rook of a Chess960 right.
bool castlingMatchesBoard(const std::array<char, 64> &squares, const std::string &field) {
    if (field == "-") return true;
    for (char c : field) {
        const bool white = std::isupper(static_cast<unsigned char>(c)) != 0;
        const int rank = white ? 0 : 7;
        const char king = white ? 'K' : 'k';
        const char rook = white ? 'R' : 'r';
        const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == 'K' || upper == 'Q') {
            if (pieceAt(squares, 4, rank) != king) return false;
            if (pieceAt(squares, upper == 'K' ? 7 : 0, rank) != rook) return false;
        } else {
            int kingFile = -1;
            for (int f = 0; f < 8; ++f) {
                if (pieceAt(squares, f, rank) == king) kingFile = f;
            }
            const int rookFile = upper - 'A';
            if (kingFile < 0 || rookFile == kingFile || pieceAt(squares, rookFile, rank) != rook) return false;
        }
    }
    return true;
}

// The en passant square must sit behind a pawn that just made a double step:
// the pawn in front of it, the square itself and the start square empty.
bool epMatchesBoard(const std::array<char, 64> &squares, const std::string &field, Side turn) {
    if (field == "-") return true;
    const int file = field[0] - 'a';
    const int rank = field[1] - '1';
    if (turn == Side::White) {
        return rank == 5 && pieceAt(squares, file, 4) == 'p' &&
               pieceAt(squares, file, 5) == '.' && pieceAt(squares, file, 6) == '.';
    }
    return rank == 2 && pieceAt(squares, file, 3) == 'P' &&
           pieceAt(squares, file, 2) == '.' && pieceAt(squares, file, 1) == '.';
}

} // namespace

std::optional<Position> ChessRules::parse(const std::string &fen) const {
    std::string text = fen;
    std::replace(text.begin(), text.end(), '_', ' ');

    std::vector<std::string> fields = split(text);
    if (fields.size() < 2 || fields.size() > 6) return std::nullopt;
    if (fields.size() < 3) fields.push_back("-");
    if (fields.size() < 4) fields.push_back("-");
    if (fields.size() < 5) fields.push_back("0");
    if (fields.size() < 6) fields.push_back("1");

    if (!validBoardField(fields[0])) return std::nullopt;
    if (fields[1] != "w" && fields[1] != "b") return std::nullopt;
    if (!validCastlingField(fields[2]) || !validEpField(fields[3])) return std::nullopt;
    if (!validCounter(fields[4]) || !validCounter(fields[5])) return std::nullopt;

    Position pos;
    pos.turn = fields[1] == "w" ? Side::White : Side::Black;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i) pos.fen.push_back(' ');
        pos.fen += fields[i];
    }
    return pos;
}

bool ChessRules::isLegal(const Position &pos) const {
    // Rights and en passant are checked on the text before the library sees them.
    const std::vector<std::string> fields = split(pos.fen);
    if (fields.size() < 4 || !validBoardField(fields[0])) return false;
    const std::array<char, 64> squares = placementOf(fields[0]);
    if (!castlingMatchesBoard(squares, fields[2])) return false;
    if (!epMatchesBoard(squares, fields[3], pos.turn)) return false;

    const chess::Board board = makeBoard(pos);

    int kings[2] = {0, 0};
    int pawns[2] = {0, 0};
    int pieces[2] = {0, 0};
    for (int i = 0; i < 64; ++i) {
        const char c = static_cast<std::string>(board.at(chess::Square(i)))[0];
        if (c == '.') continue;
        const int side = std::isupper(static_cast<unsigned char>(c)) ? 0 : 1;
        const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        ++pieces[side];
        if (upper == 'K') ++kings[side];
        if (upper == 'P') {
            ++pawns[side];
            const int rank = i / 8;
            if (rank == 0 || rank == 7) return false;
        }
    }
    for (int side = 0; side < 2; ++side) {
        if (kings[side] != 1 || pawns[side] > 8 || pieces[side] > 16) return false;
    }

    // The side that just moved may not have left its king in check.
    const chess::Color mover = board.sideToMove();
    const chess::Color other = mover == chess::Color::WHITE ? chess::Color::BLACK : chess::Color::WHITE;
    return !board.isAttacked(board.kingSq(other), mover);
}

std::vector<Move> ChessRules::legalMoves(const Position &pos) const {
    chess::Board board = makeBoard(pos);

    chess::Movelist legal;
    chess::movegen::legalmoves(legal, board);

    std::vector<Move> out;
    out.reserve(legal.size());
    for (const auto &m : legal) {
        Move mv;
        mv.uci = chess::uci::moveToUci(m);
        mv.san = chess::uci::moveToSan(board, m);
        board.makeMove(m);
        mv.fen = board.getFen();
        mv.after = terminalOf(board);
        board.unmakeMove(m);
        out.push_back(std::move(mv));
    }
    return out;
}

Terminal ChessRules::terminalStatus(const Position &pos) const {
    return terminalOf(makeBoard(pos));
}

std::string ChessRules::materialSignature(const Position &pos) const {
    const chess::Board board = makeBoard(pos);
    std::string white, black;
    for (int i = 0; i < 64; ++i) {
        const char c = static_cast<std::string>(board.at(chess::Square(i)))[0];
        if (c == '.') continue;
        if (std::isupper(static_cast<unsigned char>(c))) white.push_back(c);
        else black.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return sortPieces(white) + "v" + sortPieces(black);
}

} // namespace tbinfo
