#include "../include/http.hpp"
#include <curl/curl.h>
#include <cstdio>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

size_t file_write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<std::FILE*>(userp)) * size;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw HttpTransportError("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    explicit HeaderList(const std::vector<std::string>& headers) {
        for (const auto& h : headers) list = curl_slist_append(list, h.c_str());
    }
    ~HeaderList() { if (list) curl_slist_free_all(list); }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
};

struct Mime {
    curl_mime* m{nullptr};
    explicit Mime(CURL* h) { m = curl_mime_init(h); if (!m) throw HttpTransportError("curl_mime_init failed"); }
    ~Mime() { if (m) curl_mime_free(m); }
    Mime(const Mime&) = delete;
    Mime& operator=(const Mime&) = delete;
};

struct File {
    std::FILE* f{nullptr};
    File(const std::string& path, const char* mode) : f(std::fopen(path.c_str(), mode)) {}
    ~File() { if (f) std::fclose(f); }
    File(const File&) = delete;
    File& operator=(const File&) = delete;
};

// Handles are driven from many request threads at once, so signals stay off.
void common_opts(CurlHandle& c, const std::string& url, long timeout_ms) {
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
}

long perform(CurlHandle& c) {
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw HttpTransportError(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    return status;
}
}

HttpResponse http_get(const std::string& url, const std::vector<std::string>& headers, long timeout_ms) {
    CurlHandle c;
    HeaderList hl(headers);
    HttpResponse resp;
    common_opts(c, url, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, hl.list);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    resp.status = perform(c);
    return resp;
}

HttpResponse http_put_json(const std::string& url, const std::string& json_body,
                           const std::vector<std::string>& headers, long timeout_ms) {
    CurlHandle c;
    std::vector<std::string> all = headers;
    all.push_back("Content-Type: application/json");
    HeaderList hl(all);
    HttpResponse resp;
    common_opts(c, url, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, hl.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    resp.status = perform(c);
    return resp;
}

HttpResponse http_post_multipart(const std::string& url, const std::vector<MultipartField>& fields,
                                 long timeout_ms) {
    CurlHandle c;
    Mime mime(c.h);
    for (const auto& f : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.m);
        curl_mime_name(part, f.name.c_str());
        if (f.is_file) {
            if (curl_mime_filedata(part, f.value.c_str()) != CURLE_OK) {
                throw HttpTransportError("cannot attach file " + f.value);
            }
        } else {
            curl_mime_data(part, f.value.c_str(), CURL_ZERO_TERMINATED);
        }
    }
    HttpResponse resp;
    common_opts(c, url, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_MIMEPOST, mime.m);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    resp.status = perform(c);
    return resp;
}

HttpResponse http_download(const std::string& url, const std::string& path, long timeout_ms) {
    File out(path, "wb");
    if (!out.f) throw std::runtime_error("cannot open " + path + " for writing");
    CurlHandle c;
    HttpResponse resp;
    common_opts(c, url, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, file_write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, out.f);
    resp.status = perform(c);
    if (std::fflush(out.f) != 0) throw std::runtime_error("write to " + path + " failed");
    return resp;
}
