#include "stats_store.hpp"

#include "../material.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tbinfo {

namespace {

std::vector<std::string> split(const std::string &line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

std::optional<std::uint64_t> parseCount(const std::string &s) {
    if (s.empty() || s[0] == '-') return std::nullopt;
    try {
        std::size_t used = 0;
        const unsigned long long v = std::stoull(s, &used);
        if (used != s.size()) return std::nullopt;
        return static_cast<std::uint64_t>(v);
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

std::optional<int> parseInt(const std::string &s) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

bool isCanonicalKey(const std::string &key) {
    return isValidMaterial(key) && normalizeMaterial(key) == key;
}

} // namespace

std::optional<StatsStore> StatsStore::load(std::istream &in) {
    StatsStore store;

    std::optional<std::string> key;
    EndgameData data;
    bool haveTotal = false;

    std::string line;
    int lineNo = 0;
    auto fail = [&lineNo](const std::string &msg) {
        std::cerr << "[StatsStore] line " << lineNo << ": " << msg << '\n';
        return std::nullopt;
    };

    while (std::getline(in, line)) {
        ++lineNo;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        const std::vector<std::string> tokens = split(line);
        if (tokens.empty()) continue;

        const std::string &cmd = tokens[0];
        if (cmd == "endgame") {
            if (key) return fail("endgame " + *key + " is not closed");
            if (tokens.size() != 2) return fail("expected: endgame <material>");
            if (!isCanonicalKey(tokens[1])) return fail("not a canonical material key: " + tokens[1]);
            key = tokens[1];
            data = EndgameData{};
            haveTotal = false;
            continue;
        }

        if (!key) return fail("'" + cmd + "' outside of an endgame block");

        if (cmd == "end") {
            if (!haveTotal) data.total = data.counts.sum();
            if (!store.add(*key, std::move(data))) return fail("cannot add " + *key);
            key.reset();
        } else if (cmd == "total") {
            const auto v = tokens.size() == 2 ? parseCount(tokens[1]) : std::nullopt;
            if (!v) return fail("expected: total <count>");
            data.total = *v;
            haveTotal = true;
        } else if (cmd == "counts") {
            if (tokens.size() != 6) return fail("expected five counts");
            std::uint64_t values[5];
            for (std::size_t i = 0; i < 5; ++i) {
                const auto v = parseCount(tokens[i + 1]);
                if (!v) return fail("bad count: " + tokens[i + 1]);
                values[i] = *v;
            }
            data.counts = WdlCounts{values[0], values[1], values[2], values[3], values[4]};
        } else if (cmd == "longest") {
            if (tokens.size() < 4) return fail("expected: longest <ply> <wdl> <epd>");
            const auto ply = parseInt(tokens[1]);
            const auto wdl = parseInt(tokens[2]);
            if (!ply || !wdl || *wdl < -2 || *wdl > 2) return fail("bad longest entry");
            LongestEntry entry;
            entry.ply = *ply;
            entry.wdl = *wdl;
            for (std::size_t i = 3; i < tokens.size(); ++i) {
                if (i > 3) entry.epd.push_back(' ');
                entry.epd += tokens[i];
            }
            data.longest.push_back(std::move(entry));
        } else if (cmd == "histogram") {
            if (tokens.size() < 3) return fail("expected: histogram <white|black> <win|loss> <counts...>");
            std::optional<SideHistogram> *side = nullptr;
            if (tokens[1] == "white") side = &data.white;
            else if (tokens[1] == "black") side = &data.black;
            else return fail("bad side: " + tokens[1]);
            if (!*side) *side = SideHistogram{};
            std::vector<std::uint64_t> *series = nullptr;
            if (tokens[2] == "win") series = &(*side)->win;
            else if (tokens[2] == "loss") series = &(*side)->loss;
            else return fail("bad series: " + tokens[2]);
            series->clear();
            for (std::size_t i = 3; i < tokens.size(); ++i) {
                const auto v = parseCount(tokens[i]);
                if (!v) return fail("bad count: " + tokens[i]);
                series->push_back(*v);
            }
        } else if (cmd == "files") {
            const auto wdl = tokens.size() == 3 ? parseCount(tokens[1]) : std::nullopt;
            const auto dtz = tokens.size() == 3 ? parseCount(tokens[2]) : std::nullopt;
            if (!wdl || !dtz) return fail("expected: files <rtbw bytes> <rtbz bytes>");
            data.wdlBytes = *wdl;
            data.dtzBytes = *dtz;
        } else {
            return fail("unknown directive: " + cmd);
        }
    }

    if (key) {
        ++lineNo;
        return fail("missing 'end' for " + *key);
    }
    return store;
}

std::optional<StatsStore> StatsStore::loadFile(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[StatsStore] cannot open " << path << '\n';
        return std::nullopt;
    }
    return load(in);
}

bool StatsStore::add(const std::string &key, EndgameData data) {
    if (!isCanonicalKey(key)) return false;
    endgames_[key] = std::move(data);
    return true;
}

const EndgameData *StatsStore::find(const std::string &key) const {
    const auto it = endgames_.find(key);
    return it == endgames_.end() ? nullptr : &it->second;
}

std::vector<std::string> StatsStore::keys() const {
    std::vector<std::string> out;
    out.reserve(endgames_.size());
    for (const auto &kv : endgames_) out.push_back(kv.first);
    return out;
}

} // namespace tbinfo
