#include "ConfigManager.h"

#include <cctype>
#include <fstream>
#include <sstream>

// ---------- singleton ----------
ConfigManager& ConfigManager::instance() {
    static ConfigManager inst;
    return inst;
}

// ---------- string helpers ----------
void ConfigManager::trim_inplace(std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) { s.clear(); return; }
    size_t last  = s.find_last_not_of(" \t\r\n");
    s.erase(last + 1);
    s.erase(0, first);
}

// "key = value   # note" -> "key = value". A '#' only starts a comment
// when preceded by whitespace so URLs with fragments survive.
void ConfigManager::strip_inline_comment(std::string& s) {
    for (size_t i = 1; i < s.size(); ++i) {
        if (s[i] == '#' && (s[i - 1] == ' ' || s[i - 1] == '\t')) {
            s.erase(i);
            break;
        }
    }
    trim_inplace(s);
}

// ---------- load ----------
bool ConfigManager::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        loaded_ = false;
        kv_.clear();
        return false;
    }

    kv_.clear();
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::string trimmed = line;
        trim_inplace(trimmed);
        if (trimmed.empty()) continue;
        if (trimmed[0] == '#') continue;

        strip_inline_comment(trimmed);

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;   // malformed line
        }

        std::string key = trimmed.substr(0, eq);
        std::string val = trimmed.substr(eq + 1);

        trim_inplace(key);
        trim_inplace(val);

        if (key.empty()) continue;
        kv_[key] = val;             // last one wins
    }

    source_path_ = path;
    loaded_ = true;
    return true;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    kv_[key] = value;
}

void ConfigManager::clear() {
    kv_.clear();
    source_path_.clear();
    loaded_ = false;
}

bool ConfigManager::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

// ---------- getters ----------
std::string ConfigManager::get(const std::string& key, const std::string& default_value) const {
    auto it = kv_.find(key);
    return (it != kv_.end()) ? it->second : default_value;
}

int ConfigManager::get(const std::string& key, int default_value) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return default_value;

    int out = default_value;
    std::istringstream ss(it->second);
    ss >> out;
    if (!ss.fail()) return out;
    return default_value;
}

int64_t ConfigManager::get(const std::string& key, int64_t default_value) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return default_value;

    long long out = default_value;
    std::istringstream ss(it->second);
    ss >> out;
    if (!ss.fail()) return static_cast<int64_t>(out);
    return default_value;
}

double ConfigManager::get(const std::string& key, double default_value) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return default_value;

    double out = default_value;
    std::istringstream ss(it->second);
    ss >> out;
    if (!ss.fail()) return out;
    return default_value;
}

bool ConfigManager::get(const std::string& key, bool default_value) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return default_value;

    std::string val = it->second;
    for (char& c : val) {
        c = std::tolower(static_cast<unsigned char>(c));
    }

    if (val == "true" || val == "1" || val == "yes" || val == "on") {
        return true;
    }
    if (val == "false" || val == "0" || val == "no" || val == "off") {
        return false;
    }

    return default_value;
}
