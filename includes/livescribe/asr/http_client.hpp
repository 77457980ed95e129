#pragma once
#include <string>
#include <utility>
#include <vector>

namespace livescribe::http {

struct FormPart {
    std::string name;
    std::string value;         // field value or file contents
    std::string filename;      // non-empty: sent as a file part
    std::string content_type;
};

struct Response {
    long status = 0;           // 0 when the request never completed
    std::string body;
    std::string error;         // transport error text
    bool timed_out = false;
};

// Blocking multipart/form-data POST.
Response post_multipart(const std::string& url,
                        const std::vector<std::string>& headers,
                        const std::vector<FormPart>& parts,
                        long timeout_sec);

// Blocking JSON POST.
Response post_json(const std::string& url, const std::string& body, long timeout_sec);

} // namespace livescribe::http
