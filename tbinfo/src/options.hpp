#pragma once

#include <string>
#include <unordered_map>
#include <cctype>
#include <functional>
#include <stdexcept>

namespace tbinfo {

// Case-insensitive key/value settings filled from the command line
// (--option key=value) and from "setoption" commands.
class Options {
public:
    void set(const std::string &key, const std::string &value) {
        storage_[normalizeKey(key)] = value;
    }

    std::string get(const std::string &key, const std::string &defaultValue) const {
        const std::string nk = normalizeKey(key);
        auto it = storage_.find(nk);
        return it == storage_.end() ? defaultValue : it->second;
    }

    // Typed getters fall back to the default when the value is missing or malformed.
    int getInt(const std::string &key, int defaultValue) const {
        const std::string val = get(key, "");
        if (val.empty()) return defaultValue;
        try {
            std::size_t used = 0;
            const int parsed = std::stoi(val, &used);
            return used == val.size() ? parsed : defaultValue;
        } catch (const std::invalid_argument &) {
            return defaultValue;
        } catch (const std::out_of_range &) {
            return defaultValue;
        }
    }

    double getDouble(const std::string &key, double defaultValue) const {
        const std::string val = get(key, "");
        if (val.empty()) return defaultValue;
        try {
            std::size_t used = 0;
            const double parsed = std::stod(val, &used);
            return used == val.size() ? parsed : defaultValue;
        } catch (const std::invalid_argument &) {
            return defaultValue;
        } catch (const std::out_of_range &) {
            return defaultValue;
        }
    }

    bool getBool(const std::string &key, bool defaultValue) const {
        const std::string val = normalizeKey(get(key, ""));
        if (val == "true" || val == "1" || val == "on" || val == "yes") return true;
        if (val == "false" || val == "0" || val == "off" || val == "no") return false;
        return defaultValue;
    }

    void forEach(const std::function<void(const std::string&, const std::string&)> &fn) const {
        for (const auto &kv : storage_) fn(kv.first, kv.second);
    }

private:
    static std::string normalizeKey(const std::string &in) {
        std::string out;
        out.reserve(in.size());
        for (char c : in) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

    std::unordered_map<std::string, std::string> storage_;
};

} // namespace tbinfo
