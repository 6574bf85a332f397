#pragma once
#include <stdexcept>
#include <string>

// Provider could not be reached or answered with a server-side/throttling error.
struct ProviderUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Provider refused the request (4xx other than 429).
struct ProviderRejected : std::runtime_error {
    ProviderRejected(long http_status, const std::string& what)
        : std::runtime_error(what), status(http_status) {}
    long status;
};

struct StorageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct InvalidInput : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UpstreamError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TimeoutError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
