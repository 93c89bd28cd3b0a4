#pragma once

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace tbinfo::json {

// Minimal streaming writer producing compact single-line JSON. Commas are
// inserted automatically; callers only need to balance begin/end calls.
class Writer {
public:
    Writer &beginObject() { separate(); oss_ << '{'; first_.push_back(true); return *this; }
    Writer &endObject() { oss_ << '}'; first_.pop_back(); return *this; }
    Writer &beginArray() { separate(); oss_ << '['; first_.push_back(true); return *this; }
    Writer &endArray() { oss_ << ']'; first_.pop_back(); return *this; }

    Writer &key(const std::string &k) {
        separate();
        writeString(k);
        oss_ << ':';
        afterKey_ = true;
        return *this;
    }

    Writer &value(const std::string &v) { separate(); writeString(v); return *this; }
    Writer &value(const char *v) { return value(std::string(v)); }
    Writer &value(bool v) { separate(); oss_ << (v ? "true" : "false"); return *this; }
    Writer &value(int v) { separate(); oss_ << v; return *this; }
    Writer &value(std::uint64_t v) { separate(); oss_ << v; return *this; }
    Writer &null() { separate(); oss_ << "null"; return *this; }

    // Fixed-point number with the given number of decimals.
    Writer &value(double v, int decimals) {
        separate();
        std::ostringstream num;
        num << std::fixed << std::setprecision(decimals) << v;
        oss_ << num.str();
        return *this;
    }

    template <class T>
    Writer &value(const std::optional<T> &v) {
        if (!v) return null();
        return value(*v);
    }

    template <class T>
    Writer &field(const std::string &k, const T &v) { key(k); return value(v); }

    std::string str() const { return oss_.str(); }

private:
    std::ostringstream oss_;
    std::vector<bool> first_;
    bool afterKey_ = false;

    void separate() {
        if (afterKey_) {
            afterKey_ = false;
            return;
        }
        if (first_.empty()) return;
        if (!first_.back()) oss_ << ',';
        first_.back() = false;
    }

    void writeString(const std::string &s) {
        oss_ << '"';
        for (char c : s) {
            switch (c) {
                case '"': oss_ << "\\\""; break;
                case '\\': oss_ << "\\\\"; break;
                case '\n': oss_ << "\\n"; break;
                case '\r': oss_ << "\\r"; break;
                case '\t': oss_ << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        oss_ << buf;
                    } else {
                        oss_ << c;
                    }
            }
        }
        oss_ << '"';
    }
};

} // namespace tbinfo::json
