#include "MultipartBuilder.h"

#include <random>

MultipartBuilder::MultipartBuilder(const std::string& b)
    : boundary(b),
      finished(false)
{
    if (boundary.empty()) {
        static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<int> pick(0, 35);
        boundary = "----clipuplink";
        for (int i = 0; i < 24; i++) {
            boundary.push_back(alphabet[pick(rng)]);
        }
    }
}

std::string MultipartBuilder::escape_quotes(const std::string& text)
{
    std::string out;
    for (char c : text) {
        if (c == '"') {
            out += "%22";
        } else if (c == '\r' || c == '\n') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void MultipartBuilder::add_field(const std::string& name, const std::string& value)
{
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + escape_quotes(name) + "\"\r\n\r\n";
    body += value;
    body += "\r\n";
}

void MultipartBuilder::add_file(const std::string& name, const std::string& file_name,
                                const std::string& mime_type, const std::vector<uint8_t>& data)
{
    add_file(name, file_name, mime_type, data.empty() ? nullptr : &data[0], data.size());
}

void MultipartBuilder::add_file(const std::string& name, const std::string& file_name,
                                const std::string& mime_type, const uint8_t* data, size_t length)
{
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + escape_quotes(name) +
            "\"; filename=\"" + escape_quotes(file_name) + "\"\r\n";
    body += "Content-Type: " + mime_type + "\r\n\r\n";
    if (data && length > 0) {
        body.append(reinterpret_cast<const char*>(data), length);
    }
    body += "\r\n";
}

std::string MultipartBuilder::content_type() const
{
    return "multipart/form-data; boundary=" + boundary;
}

std::string MultipartBuilder::finish()
{
    if (!finished) {
        body += "--" + boundary + "--\r\n";
        finished = true;
    }
    return body;
}
