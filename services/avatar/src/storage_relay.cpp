#include "../include/storage_relay.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "../../../shared/cpp/http/include/http.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <vector>
#include <stdlib.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {
// Owns a freshly created temp file and removes it on scope exit.
struct TempFile {
    std::string path;
    explicit TempFile(const std::string& suffix) {
        std::string tmpl = (std::filesystem::temp_directory_path() / ("avatar-XXXXXX" + suffix)).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
        if (fd < 0) throw StorageError("cannot create temp file in " + tmpl);
        ::close(fd);
        path = buf.data();
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) std::cerr << "[cloudinary] Could not remove " << path << ": " << ec.message() << std::endl;
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
};
}

std::string cloudinary_string_to_sign(const std::map<std::string, std::string>& params,
                                      const std::string& api_secret) {
    std::string out;
    for (const auto& kv : params) {
        if (kv.second.empty()) continue;
        if (!out.empty()) out += '&';
        out += kv.first + "=" + kv.second;
    }
    return out + api_secret;
}

std::string cloudinary_signature(const std::map<std::string, std::string>& params,
                                 const std::string& api_secret) {
    return sha1_hex(cloudinary_string_to_sign(params, api_secret));
}

CloudinaryRelay::CloudinaryRelay(CloudinaryConfig cfg) : cfg_(std::move(cfg)) {}

std::string CloudinaryRelay::upload(const std::string& source_url) {
    TempFile tmp(".mp4");
    HttpResponse r;
    try {
        r = http_download(source_url, tmp.path, cfg_.timeout_ms);
    } catch (const std::runtime_error& e) {
        throw StorageError(std::string("artifact download failed: ") + e.what());
    }
    if (!r.ok()) {
        throw StorageError("artifact download failed [" + std::to_string(r.status) + "]");
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(tmp.path, ec);
    std::cout << "[cloudinary] Downloaded " << (ec ? 0 : size) << " bytes, uploading" << std::endl;
    return upload_file(tmp.path);
}

std::string CloudinaryRelay::upload_file(const std::string& path) {
    std::map<std::string, std::string> params = {
        {"folder", cfg_.folder},
        {"timestamp", std::to_string(static_cast<long long>(std::time(nullptr)))},
        {"type", cfg_.delivery_type},
    };
    std::vector<MultipartField> fields;
    fields.push_back({"file", path, true});
    fields.push_back({"api_key", cfg_.api_key});
    for (const auto& kv : params) fields.push_back({kv.first, kv.second});
    fields.push_back({"signature", cloudinary_signature(params, cfg_.api_secret)});

    std::string url = cfg_.api_base + "/" + cfg_.cloud_name + "/video/upload";
    HttpResponse r;
    try {
        r = http_post_multipart(url, fields, cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw StorageError(std::string("upload failed: ") + e.what());
    }
    if (!r.ok()) {
        throw StorageError("upload failed [" + std::to_string(r.status) + "]: " + r.body);
    }
    try {
        auto j = json::parse(r.body);
        std::string secure_url = j.at("secure_url").get<std::string>();
        std::cout << "[cloudinary] Stored " << j.value("public_id", std::string("?")) << std::endl;
        return secure_url;
    } catch (const json::exception& e) {
        throw StorageError(std::string("unexpected upload response: ") + e.what());
    }
}
