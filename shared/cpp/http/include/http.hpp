#pragma once
#include <string>
#include <vector>
#include <stdexcept>

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// libcurl gave up before any HTTP status arrived (DNS, connect, TLS, timeout).
struct HttpTransportError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct MultipartField {
    std::string name;
    std::string value;
    bool is_file{false}; // value is a local path to attach
};

HttpResponse http_get(const std::string& url, const std::vector<std::string>& headers = {},
                      long timeout_ms = 30000);
HttpResponse http_put_json(const std::string& url, const std::string& json_body,
                           const std::vector<std::string>& headers = {}, long timeout_ms = 30000);
HttpResponse http_post_multipart(const std::string& url, const std::vector<MultipartField>& fields,
                                 long timeout_ms = 600000);

// Streams the response body into `path`; the returned body is left empty.
HttpResponse http_download(const std::string& url, const std::string& path, long timeout_ms = 600000);
