#include "livescribe/asr/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace livescribe::http {

namespace {

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
struct MimeDeleter {
    void operator()(curl_mime* m) const { curl_mime_free(m); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

SlistPtr make_headers(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }
    return SlistPtr(list);
}

Response perform(CURL* curl, const std::string& url, curl_slist* headers, long timeout_sec) {
    Response resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        resp.error = curl_easy_strerror(rc);
        resp.timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
        return resp;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace

Response post_multipart(const std::string& url,
                        const std::vector<std::string>& headers,
                        const std::vector<FormPart>& parts,
                        long timeout_sec) {
    global_init();
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        Response r;
        r.error = "curl_easy_init failed";
        return r;
    }

    std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
    for (const auto& p : parts) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, p.name.c_str());
        curl_mime_data(part, p.value.data(), p.value.size());
        if (!p.filename.empty()) curl_mime_filename(part, p.filename.c_str());
        if (!p.content_type.empty()) curl_mime_type(part, p.content_type.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

    auto hdrs = make_headers(headers);
    return perform(curl.get(), url, hdrs.get(), timeout_sec);
}

Response post_json(const std::string& url, const std::string& body, long timeout_sec) {
    global_init();
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        Response r;
        r.error = "curl_easy_init failed";
        return r;
    }
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    auto hdrs = make_headers({"Content-Type: application/json"});
    return perform(curl.get(), url, hdrs.get(), timeout_sec);
}

} // namespace livescribe::http
