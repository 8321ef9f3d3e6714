#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include <functional>
#include <map>
#include <string>
#include "SubmissionTypes.h"

struct HttpRequest {
    std::string method;
    std::string url;
    FieldList headers;
    std::string body;
    int timeout_ms;

    HttpRequest() : timeout_ms(0) {}

    void set_header(const std::string& name, const std::string& value);
};

struct HttpResponse {
    bool transport_ok;      // false: no HTTP status (DNS, connect, timeout)
    int status;
    std::map<std::string, std::string> headers;   // lower-case names
    std::string body;
    std::string error;

    HttpResponse() : transport_ok(false), status(0) {}

    bool is_success() const { return transport_ok && status >= 200 && status < 300; }

    // Case-insensitive lookup, empty when absent
    std::string header(const std::string& name) const;
};

typedef std::function<void(const HttpResponse&)> HttpCallback;

// Asynchronous HTTP. send() never blocks; the callback runs from poll(),
// which the EventLoop drives.
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    virtual void send(const HttpRequest& request, HttpCallback callback) = 0;

    // Advances transfers and delivers finished responses.
    // Returns true while any transfer is outstanding.
    virtual bool poll() = 0;
};

// Hook for backend-specific request signing (nonce, bearer token, ...)
class RequestAuthenticator {
public:
    virtual ~RequestAuthenticator() {}
    virtual void authenticate(HttpRequest& request) = 0;
};

#endif // HTTP_TRANSPORT_H
