#include "HttpTransport.h"
#include "Utility.h"

void HttpRequest::set_header(const std::string& name, const std::string& value)
{
    std::string lower = to_lower_copy(name);
    for (size_t i = 0; i < headers.size(); i++) {
        if (to_lower_copy(headers[i].first) == lower) {
            headers[i].second = value;
            return;
        }
    }
    headers.push_back(std::make_pair(name, value));
}

std::string HttpResponse::header(const std::string& name) const
{
    auto it = headers.find(to_lower_copy(name));
    return (it != headers.end()) ? it->second : std::string();
}
