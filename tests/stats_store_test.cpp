#include "check.hpp"
#include "stats/stats_store.hpp"

#include <sstream>
#include <string>

using namespace tbinfo;
using tbinfo_test::check;
using tbinfo_test::checkEq;

namespace {

std::optional<StatsStore> loadText(const std::string &text) {
    std::istringstream in(text);
    return StatsStore::load(in);
}

void testLoad() {
    const auto store = loadText(
        "# sample\n"
        "endgame KRNvKNN\n"
        "total 4455813974\n"
        "counts 2959977091 0 1333429189 103306 162344388\n"
        "longest 485 1 6k1/5n2/8/8/8/5n2/1RK5/1N6 w - -\n"
        "histogram white win 0 1924310948 35087\n"
        "histogram white loss 98698 144 3810 0 596 0 58\n"
        "files 1048576 2097152\n"
        "end\n"
        "\n"
        "endgame KQvK   # trailing comment\n"
        "counts 10 0 2 0 0\n"
        "end\n");
    check("load-ok", store.has_value());
    if (!store) return;

    checkEq("load-size", store->size(), std::size_t(2));
    const EndgameData *krn = store->find("KRNvKNN");
    check("load-find", krn != nullptr);
    if (krn) {
        checkEq("load-total", krn->total, std::uint64_t(4455813974ULL));
        checkEq("load-white", krn->counts.white, std::uint64_t(2959977091ULL));
        checkEq("load-black", krn->counts.black, std::uint64_t(162344388ULL));
        checkEq("load-longest-count", krn->longest.size(), std::size_t(1));
        if (!krn->longest.empty()) {
            checkEq("load-longest-epd", krn->longest[0].epd, std::string("6k1/5n2/8/8/8/5n2/1RK5/1N6 w - -"));
            checkEq("load-longest-ply", krn->longest[0].ply, 485);
            checkEq("load-longest-wdl", krn->longest[0].wdl, 1);
        }
        check("load-white-hist", krn->white.has_value() && krn->white->win.size() == 3 &&
                                 krn->white->loss.size() == 7);
        check("load-no-black-hist", !krn->black.has_value());
        checkEq("load-rtbw", krn->wdlBytes.value_or(0), std::uint64_t(1048576));
        checkEq("load-rtbz", krn->dtzBytes.value_or(0), std::uint64_t(2097152));
    }

    const EndgameData *kq = store->find("KQvK");
    check("load-default-total", kq != nullptr && kq->total == 12);
    check("load-missing", store->find("KRvK") == nullptr);
    check("load-keys", store->keys().size() == 2 && store->keys().front() == "KQvK");
}

void testErrors() {
    check("err-noncanonical", !loadText("endgame KNNvKRN\nend\n").has_value());
    check("err-lowercase", !loadText("endgame krvk\nend\n").has_value());
    check("err-unclosed", !loadText("endgame KRvK\ncounts 1 0 0 0 0\n").has_value());
    check("err-nested", !loadText("endgame KRvK\nendgame KQvK\nend\n").has_value());
    check("err-outside", !loadText("counts 1 0 0 0 0\n").has_value());
    check("err-count-arity", !loadText("endgame KRvK\ncounts 1 2 3\nend\n").has_value());
    check("err-negative", !loadText("endgame KRvK\ncounts 1 -2 3 0 0\nend\n").has_value());
    check("err-garbage-number", !loadText("endgame KRvK\ntotal 12x\nend\n").has_value());
    check("err-wdl-range", !loadText("endgame KRvK\nlongest 10 3 8/8/8/8/8/8/8/8 w - -\nend\n").has_value());
    check("err-side", !loadText("endgame KRvK\nhistogram red win 1 2\nend\n").has_value());
    check("err-series", !loadText("endgame KRvK\nhistogram white draw 1 2\nend\n").has_value());
    check("err-directive", !loadText("endgame KRvK\nfoo 1\nend\n").has_value());

    const auto empty = loadText("# nothing here\n\n");
    check("empty-ok", empty.has_value() && empty->empty());

    check("file-missing", !StatsStore::loadFile("/nonexistent/tbinfo-stats.txt").has_value());
}

void testAdd() {
    StatsStore store;
    check("add-canonical", store.add("KRvK", EndgameData{}));
    check("add-noncanonical", !store.add("KvKR", EndgameData{}));
    check("add-invalid", !store.add("garbage", EndgameData{}));
    checkEq("add-size", store.size(), std::size_t(1));
}

} // namespace

int main() {
    testLoad();
    testErrors();
    testAdd();
    return tbinfo_test::finish("stats_store");
}
