#ifndef CURL_HTTP_TRANSPORT_H
#define CURL_HTTP_TRANSPORT_H

#include <curl/curl.h>
#include <map>
#include <vector>
#include "HttpTransport.h"

// libcurl multi-interface transport. Transfers progress only inside poll().
class CurlHttpTransport : public HttpTransport
{
public:
    CurlHttpTransport();
    ~CurlHttpTransport();

    bool is_ready() const { return multi != nullptr; }

    void send(const HttpRequest& request, HttpCallback callback) override;
    bool poll() override;

    size_t active_transfers() const { return transfers.size(); }

private:
    struct Transfer {
        CURL* easy;
        curl_slist* header_list;
        std::string request_body;
        HttpResponse response;
        HttpCallback callback;
        char error_buffer[CURL_ERROR_SIZE];
    };

    static size_t on_body(char* data, size_t size, size_t nmemb, void* userdata);
    static size_t on_header(char* data, size_t size, size_t nmemb, void* userdata);

    void finish_transfer(CURL* easy, CURLcode result);
    void fail_immediately(const HttpRequest& request, HttpCallback callback,
                          const std::string& reason);

    CURLM* multi;
    std::map<CURL*, Transfer*> transfers;
    std::vector<std::pair<HttpCallback, HttpResponse>> deferred;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;
};

#endif // CURL_HTTP_TRANSPORT_H
