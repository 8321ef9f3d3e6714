#include "Utility.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

std::string base64_encode(const std::string& input)
{
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < input.size()) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8) |
                     static_cast<uint8_t>(input[i + 2]);
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.push_back(table[(n >> 6) & 0x3F]);
        out.push_back(table[n & 0x3F]);
        i += 3;
    }

    size_t rest = input.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8);
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.push_back(table[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string sanitize_metadata_value(const std::string& value, size_t max_chars)
{
    std::string cleaned = value;
    for (char& c : cleaned) {
        if (c == '\r' || c == '\n' || c == '\t') {
            c = ' ';
        }
    }
    cleaned = trim_copy(cleaned);

    if (cleaned.size() > max_chars) {
        if (max_chars <= 3) {
            return cleaned.substr(0, max_chars);
        }
        cleaned = cleaned.substr(0, max_chars - 3) + "...";
    }
    return cleaned;
}

std::string sanitize_metadata_key(const std::string& key)
{
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    return out;
}

std::string generate_submission_id(int64_t now_ms)
{
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> pick(0, 35);

    std::string suffix;
    for (int i = 0; i < 9; i++) {
        suffix.push_back(alphabet[pick(rng)]);
    }
    return "sub-" + std::to_string(now_ms) + "-" + suffix;
}

std::string trim_copy(const std::string& s)
{
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string to_lower_copy(const std::string& s)
{
    std::string out = s;
    for (char& c : out) {
        c = std::tolower(static_cast<unsigned char>(c));
    }
    return out;
}

bool parse_int_list(const std::string& csv, std::vector<int64_t>& out)
{
    std::vector<int64_t> values;
    std::stringstream ss(csv);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (item.empty()) {
            return false;
        }
        char* end = nullptr;
        long long v = std::strtoll(item.c_str(), &end, 10);
        if (end == item.c_str() || *end != '\0' || v < 0) {
            return false;
        }
        values.push_back(static_cast<int64_t>(v));
    }

    if (values.empty()) {
        return false;
    }
    out.swap(values);
    return true;
}

FieldList parse_header_list(const std::string& text)
{
    FieldList headers;
    std::stringstream ss(text);
    std::string item;

    while (std::getline(ss, item, ';')) {
        size_t colon = item.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = trim_copy(item.substr(0, colon));
        std::string value = trim_copy(item.substr(colon + 1));
        if (!name.empty()) {
            headers.push_back(std::make_pair(name, value));
        }
    }
    return headers;
}

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0) {
        return false;
    }
    in.seekg(0, std::ios::beg);

    out.resize(static_cast<size_t>(size));
    if (size > 0) {
        in.read(reinterpret_cast<char*>(&out[0]), size);
    }
    return static_cast<bool>(in) || in.eof();
}

std::string base_name(const std::string& path)
{
    size_t slash = path.find_last_of('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

std::string guess_mime_type(const std::string& file_name)
{
    size_t dot = file_name.find_last_of('.');
    if (dot == std::string::npos) {
        return "audio/webm";
    }
    std::string ext = to_lower_copy(file_name.substr(dot + 1));
    if (ext == "wav") return "audio/wav";
    if (ext == "mp3") return "audio/mpeg";
    if (ext == "ogg" || ext == "oga" || ext == "opus") return "audio/ogg";
    if (ext == "m4a" || ext == "mp4") return "audio/mp4";
    if (ext == "flac") return "audio/flac";
    return "audio/webm";
}
