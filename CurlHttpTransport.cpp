#include "CurlHttpTransport.h"
#include "Utility.h"
#include "logger.h"

#include <cstring>

CurlHttpTransport::CurlHttpTransport()
    : multi(curl_multi_init())
{
    if (!multi) {
        LOG_ERROR_CTX("http", "curl_multi_init failed");
    }
}

CurlHttpTransport::~CurlHttpTransport()
{
    for (auto& entry : transfers) {
        Transfer* t = entry.second;
        if (multi) {
            curl_multi_remove_handle(multi, t->easy);
        }
        curl_easy_cleanup(t->easy);
        curl_slist_free_all(t->header_list);
        delete t;
    }
    transfers.clear();

    if (multi) {
        curl_multi_cleanup(multi);
        multi = nullptr;
    }
}

size_t CurlHttpTransport::on_body(char* data, size_t size, size_t nmemb, void* userdata)
{
    Transfer* t = static_cast<Transfer*>(userdata);
    t->response.body.append(data, size * nmemb);
    return size * nmemb;
}

size_t CurlHttpTransport::on_header(char* data, size_t size, size_t nmemb, void* userdata)
{
    Transfer* t = static_cast<Transfer*>(userdata);
    std::string line(data, size * nmemb);

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.compare(0, 5, "HTTP/") == 0) {
        t->response.headers.clear();
        return size * nmemb;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = to_lower_copy(trim_copy(line.substr(0, colon)));
        std::string value = trim_copy(line.substr(colon + 1));
        if (!name.empty()) {
            t->response.headers[name] = value;
        }
    }
    return size * nmemb;
}

void CurlHttpTransport::fail_immediately(const HttpRequest& request, HttpCallback callback,
                                         const std::string& reason)
{
    LOG_ERROR_CTX("http", "%s %s not started: %s",
                  request.method.c_str(), request.url.c_str(), reason.c_str());
    HttpResponse response;
    response.transport_ok = false;
    response.error = reason;
    // Delivered from poll() so callers always see asynchronous completion
    deferred.push_back(std::make_pair(callback, response));
}

void CurlHttpTransport::send(const HttpRequest& request, HttpCallback callback)
{
    if (!multi) {
        fail_immediately(request, callback, "transport not initialized");
        return;
    }

    CURL* easy = curl_easy_init();
    if (!easy) {
        fail_immediately(request, callback, "curl_easy_init failed");
        return;
    }

    Transfer* t = new Transfer();
    t->easy = easy;
    t->header_list = nullptr;
    t->request_body = request.body;
    t->callback = callback;
    t->error_buffer[0] = '\0';

    for (size_t i = 0; i < request.headers.size(); i++) {
        std::string line = request.headers[i].first + ": " + request.headers[i].second;
        t->header_list = curl_slist_append(t->header_list, line.c_str());
    }
    // libcurl adds "Expect: 100-continue" for large bodies; tus servers don't need it
    t->header_list = curl_slist_append(t->header_list, "Expect:");

    curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, t->header_list);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlHttpTransport::on_body);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, t);
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlHttpTransport::on_header);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, t);
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, t->error_buffer);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_PRIVATE, t);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }

    if (request.method == "HEAD") {
        curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
    } else if (request.method == "GET") {
        curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(easy, CURLOPT_POST, 1L);
        curl_easy_setopt(easy, CURLOPT_POSTFIELDS, t->request_body.data());
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(t->request_body.size()));
        if (request.method != "POST") {
            curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
    }

    CURLMcode rc = curl_multi_add_handle(multi, easy);
    if (rc != CURLM_OK) {
        curl_easy_cleanup(easy);
        curl_slist_free_all(t->header_list);
        delete t;
        fail_immediately(request, callback, curl_multi_strerror(rc));
        return;
    }

    transfers[easy] = t;
    LOG_DEBUG_CTX("http", "%s %s (%zu bytes, timeout %d ms)",
                  request.method.c_str(), request.url.c_str(),
                  request.body.size(), request.timeout_ms);
}

void CurlHttpTransport::finish_transfer(CURL* easy, CURLcode result)
{
    auto it = transfers.find(easy);
    if (it == transfers.end()) {
        return;
    }
    Transfer* t = it->second;
    transfers.erase(it);
    curl_multi_remove_handle(multi, easy);

    if (result == CURLE_OK) {
        long code = 0;
        curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &code);
        t->response.transport_ok = true;
        t->response.status = static_cast<int>(code);
    } else {
        t->response.transport_ok = false;
        t->response.error = (t->error_buffer[0] != '\0') ? t->error_buffer
                                                          : curl_easy_strerror(result);
    }

    HttpCallback callback = t->callback;
    HttpResponse response = t->response;

    curl_easy_cleanup(easy);
    curl_slist_free_all(t->header_list);
    delete t;

    // May call send() again
    callback(response);
}

bool CurlHttpTransport::poll()
{
    if (!deferred.empty()) {
        std::vector<std::pair<HttpCallback, HttpResponse>> ready;
        ready.swap(deferred);
        for (size_t i = 0; i < ready.size(); i++) {
            ready[i].first(ready[i].second);
        }
    }

    if (!multi || transfers.empty()) {
        return !deferred.empty();
    }

    int running = 0;
    curl_multi_perform(multi, &running);

    int remaining = 0;
    CURLMsg* msg = nullptr;
    std::vector<std::pair<CURL*, CURLcode>> done;
    while ((msg = curl_multi_info_read(multi, &remaining)) != nullptr) {
        if (msg->msg == CURLMSG_DONE) {
            done.push_back(std::make_pair(msg->easy_handle, msg->data.result));
        }
    }
    for (size_t i = 0; i < done.size(); i++) {
        finish_transfer(done[i].first, done[i].second);
    }

    if (!transfers.empty() && done.empty()) {
        // Block briefly on the sockets instead of spinning the main loop
        int numfds = 0;
        curl_multi_wait(multi, nullptr, 0, 10, &numfds);
    }

    return !transfers.empty() || !deferred.empty();
}
