#ifndef MULTIPART_BUILDER_H
#define MULTIPART_BUILDER_H

#include <cstdint>
#include <string>
#include <vector>

// Builds a multipart/form-data body in memory
class MultipartBuilder
{
public:
    // Empty boundary: a random one is generated
    explicit MultipartBuilder(const std::string& boundary = std::string());

    void add_field(const std::string& name, const std::string& value);
    void add_file(const std::string& name, const std::string& file_name,
                  const std::string& mime_type, const std::vector<uint8_t>& data);
    void add_file(const std::string& name, const std::string& file_name,
                  const std::string& mime_type, const uint8_t* data, size_t length);

    std::string content_type() const;
    const std::string& get_boundary() const { return boundary; }

    // Appends the closing boundary and returns the body
    std::string finish();

private:
    static std::string escape_quotes(const std::string& text);

    std::string boundary;
    std::string body;
    bool finished;
};

#endif // MULTIPART_BUILDER_H
