#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <cstdint>
#include <string>
#include <unordered_map>

class ConfigManager {
public:
    static ConfigManager& instance();

    // Load "key=value" pairs from a text file. Lines starting with '#' are ignored.
    // Returns true on success (file opened and parsed).
    bool load(const std::string& path);

    // Command-line overrides and tests
    void set(const std::string& key, const std::string& value);
    void clear();
    bool has(const std::string& key) const;

    // Generic typed getters
    std::string get(const std::string& key, const std::string& default_value) const;
    int         get(const std::string& key, int default_value) const;
    int64_t     get(const std::string& key, int64_t default_value) const;
    double      get(const std::string& key, double default_value) const;
    bool        get(const std::string& key, bool default_value) const;

    std::string get_version() const {
        return get("system.version", std::string("1.0.0"));
    }

    std::string get_log_directory() const {
        return get("system.log_directory", std::string("./logs"));
    }

    std::string get_log_level() const {
        return get("system.log_level", std::string("info"));
    }

    std::string get_database_file() const {
        return get("queue.database_file", std::string("./clip_uplink.db"));
    }

    std::string get_resumable_endpoint() const {
        return get("upload.resumable_endpoint", std::string(""));
    }

    std::string get_direct_endpoint() const {
        return get("upload.direct_endpoint", std::string(""));
    }

    std::string get_chunked_endpoint() const {
        return get("upload.chunked_endpoint", std::string(""));
    }

    bool is_resumable_enabled() const {
        return get("upload.resumable_enabled", true);
    }

    // Empty means "use the tier delay tables"
    std::string get_retry_delays() const {
        return get("upload.retry_delays", std::string(""));
    }

    // "Name: value; Name: value"
    std::string get_upload_headers() const {
        return get("upload.headers", std::string(""));
    }

    bool is_loaded() const { return loaded_; }
    const std::string& get_source_path() const { return source_path_; }

private:
    ConfigManager() = default;

    static void trim_inplace(std::string& s);
    static void strip_inline_comment(std::string& s);

    std::unordered_map<std::string, std::string> kv_;
    std::string source_path_;
    bool loaded_ = false;
};

#endif // CONFIGMANAGER_H
