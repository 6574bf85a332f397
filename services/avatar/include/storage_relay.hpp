#pragma once
#include <map>
#include <string>

class StorageRelay {
public:
    virtual ~StorageRelay() = default;
    // Copies the artifact at `source_url` into storage and returns its URL.
    // Throws StorageError.
    virtual std::string upload(const std::string& source_url) = 0;
};

struct CloudinaryConfig {
    std::string cloud_name;
    std::string api_key;
    std::string api_secret;
    std::string folder{"avatar_videos"};
    std::string delivery_type{"authenticated"};
    std::string api_base{"https://api.cloudinary.com/v1_1"};
    long timeout_ms{600000};
};

// "k1=v1&k2=v2..." over the sorted params, followed by the secret.
std::string cloudinary_string_to_sign(const std::map<std::string, std::string>& params,
                                      const std::string& api_secret);
std::string cloudinary_signature(const std::map<std::string, std::string>& params,
                                 const std::string& api_secret);

class CloudinaryRelay : public StorageRelay {
public:
    explicit CloudinaryRelay(CloudinaryConfig cfg);
    std::string upload(const std::string& source_url) override;

private:
    std::string upload_file(const std::string& path);
    CloudinaryConfig cfg_;
};
