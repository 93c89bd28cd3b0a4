#include "material.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <deque>
#include <set>
#include <utility>

namespace tbinfo {

namespace {

int pieceIndex(char c) {
    const char *p = std::strchr(kPieceOrder, c);
    return (p != nullptr && c != '\0') ? static_cast<int>(p - kPieceOrder) : 6;
}

std::string upper(const std::string &in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return out;
}

// Splits an upper-cased signature at 'V'. A missing separator means an empty
// second side.
std::pair<std::string, std::string> splitSides(const std::string &material) {
    const std::string m = upper(material);
    const auto pos = m.find('V');
    if (pos == std::string::npos) return {m, std::string()};
    return {m.substr(0, pos), m.substr(pos + 1)};
}

std::vector<int> indices(const std::string &side) {
    std::vector<int> out;
    out.reserve(side.size());
    for (char c : side) out.push_back(pieceIndex(c));
    return out;
}

// Orders candidate tables: more pieces first, then alphabetically.
struct DependencyOrder {
    bool operator()(const std::string &a, const std::string &b) const {
        const int ca = pieceCount(a);
        const int cb = pieceCount(b);
        if (ca != cb) return ca > cb;
        return a < b;
    }
};

void addIfTable(std::set<std::string, DependencyOrder> &out, const std::string &w, const std::string &b) {
    const std::string key = normalizeMaterial(w + "v" + b);
    if (key != "KvK") out.insert(key);
}

} // namespace

std::string sortPieces(std::string pieces) {
    std::stable_sort(pieces.begin(), pieces.end(), [](char a, char b) {
        return pieceIndex(a) < pieceIndex(b);
    });
    return pieces;
}

bool isValidMaterial(const std::string &material) {
    const auto sep = material.find('v');
    if (sep == std::string::npos || material.find('v', sep + 1) != std::string::npos) return false;
    auto validSide = [](const std::string &side) {
        if (std::count(side.begin(), side.end(), 'K') != 1) return false;
        return std::all_of(side.begin(), side.end(), [](char c) { return pieceIndex(c) < 6; });
    };
    return validSide(material.substr(0, sep)) && validSide(material.substr(sep + 1));
}

std::string normalizeMaterial(const std::string &material) {
    auto [w, b] = splitSides(material);
    w = sortPieces(w);
    b = sortPieces(b);

    // (len(w), b) < (len(b), w) means b is the stronger side.
    const auto key = [](const std::string &count, const std::string &seq) {
        return std::make_pair(count.size(), indices(seq));
    };
    if (key(w, b) < key(b, w)) std::swap(w, b);
    return w + "v" + b;
}

std::string mirrorMaterial(const std::string &material) {
    const auto [w, b] = splitSides(material);
    return b + "v" + w;
}

int pieceCount(const std::string &material) {
    return static_cast<int>(std::count_if(material.begin(), material.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) && c != 'v' && c != 'V';
    }));
}

std::string materialKey(const Rules &rules, const Position &pos) {
    return normalizeMaterial(rules.materialSignature(pos));
}

std::vector<std::string> dependencies(const std::string &material) {
    const auto [w, b] = splitSides(normalizeMaterial(material));
    std::set<std::string, DependencyOrder> out;

    auto expand = [&out](const std::string &side, const std::string &other, bool sideFirst) {
        for (std::size_t i = 0; i < side.size(); ++i) {
            if (side[i] == 'K') continue;
            std::string reduced = side;
            reduced.erase(i, 1);
            if (sideFirst) addIfTable(out, reduced, other);
            else addIfTable(out, other, reduced);

            if (side[i] != 'P') continue;
            for (char promo : {'Q', 'R', 'B', 'N'}) {
                std::string promoted = side;
                promoted[i] = promo;
                if (sideFirst) addIfTable(out, promoted, other);
                else addIfTable(out, other, promoted);
            }
        }
    };
    expand(w, b, true);
    expand(b, w, false);

    return std::vector<std::string>(out.begin(), out.end());
}

std::vector<std::string> transitiveDependencies(const std::string &material) {
    const std::string root = normalizeMaterial(material);
    std::set<std::string, DependencyOrder> seen;
    std::deque<std::string> queue{root};
    while (!queue.empty()) {
        const std::string current = std::move(queue.front());
        queue.pop_front();
        for (auto &dep : dependencies(current)) {
            if (dep == root) continue;
            if (seen.insert(dep).second) queue.push_back(dep);
        }
    }
    return std::vector<std::string>(seen.begin(), seen.end());
}

} // namespace tbinfo
