#pragma once

#include "rules/rules.hpp"

#include <string>
#include <vector>

namespace tbinfo {

// Piece letters in descending value. Every signature lists pieces in this order.
inline constexpr const char *kPieceOrder = "KQRBNP";

// Sorts piece letters (upper case) by kPieceOrder. Unknown letters go last.
std::string sortPieces(std::string pieces);

// True for "XvY" where each side is one K followed by Q/R/B/N/P letters.
bool isValidMaterial(const std::string &material);

// Canonical endgame key. Input is case-insensitive and may list either side
// first. The side with more pieces comes first; on equal counts the side with
// the stronger sorted piece sequence comes first. The side to move never
// matters.
std::string normalizeMaterial(const std::string &material);

// Swaps the two sides without normalizing ("KRvKN" -> "KNvKR").
std::string mirrorMaterial(const std::string &material);

// Number of piece letters in a signature.
int pieceCount(const std::string &material);

// Canonical key of the pieces on the board.
std::string materialKey(const Rules &rules, const Position &pos);

// Tables reached from this endgame by one capture or one promotion,
// normalized, without duplicates and without KvK. Sorted by piece count
// (descending), then by key.
std::vector<std::string> dependencies(const std::string &material);

// Closure of dependencies(), same ordering, not including material itself.
std::vector<std::string> transitiveDependencies(const std::string &material);

} // namespace tbinfo
