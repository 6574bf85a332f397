#include <iostream>
#include <string>
#include <cctype>
#include <csignal>
#include <cstdint>
#include <map>
#include <unistd.h>
#include <curl/curl.h>
#include <microhttpd.h>
#include "../include/api.hpp"
#include "../include/config.hpp"
#include "../include/orchestrator.hpp"
#include "../include/provider_client.hpp"
#include "../include/storage_relay.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult send_response(struct MHD_Connection* conn, const ApiReply& reply) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(reply.body.size(), (void*)reply.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    if (!reply.body.empty()) MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MHD_add_response_header(resp, "Access-Control-Allow-Origin", "*");
    MHD_add_response_header(resp, "Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    MHD_add_response_header(resp, "Access-Control-Allow-Headers", "Content-Type, X-API-Key");
    MhdResult ret = MHD_queue_response(conn, reply.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult collect_header(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string, std::string>*>(cls);
    std::string k = key ? key : "";
    for (auto& ch : k) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    (*m)[k] = val ? val : "";
    return MHD_YES;
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }
    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    ApiRequest req{ci->method, ci->url, {}, ci->body};
    MHD_get_connection_values(connection, MHD_HEADER_KIND, &collect_header, &req.headers);
    ApiReply reply = static_cast<AvatarApi*>(cls)->handle(req);
    std::cout << "[avatar] " << req.method << " " << req.path << " -> " << reply.status << std::endl;
    return send_response(connection, reply);
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

void usage() {
    std::cerr << "avatar_service usage:\n"
              << "  avatar_service [--port N] [--env-file PATH]\n";
}
}

int main(int argc, char** argv) {
    std::string env_file = ".env";
    int port_override = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--env-file" && i + 1 < argc) env_file = argv[++i];
        else if (a == "--port" && i + 1 < argc) {
            try { port_override = parse_port(argv[++i]); }
            catch (const std::exception& e) { std::cerr << "[avatar] " << e.what() << std::endl; usage(); return 2; }
        }
        else { usage(); return 2; }
    }

    ServiceConfig cfg;
    try {
        load_dotenv(env_file);
        cfg = load_config_from_env();
    } catch (const std::exception& e) {
        std::cerr << "[avatar] " << e.what() << std::endl;
        return 1;
    }
    if (port_override > 0) cfg.port = port_override;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[avatar] curl_global_init failed" << std::endl;
        return 1;
    }

    AzureAvatarClient provider(cfg.azure);
    CloudinaryRelay storage(cfg.cloudinary);
    AvatarOrchestrator orchestrator(provider, storage, cfg.poller);
    AvatarApi api(cfg.api_key, orchestrator);

    std::cout << "[avatar] Starting HTTP server on port " << cfg.port << " (endpoint " << cfg.azure.endpoint
              << ", budget " << cfg.poller.budget.count() / 1000 << "s, interval "
              << cfg.poller.interval.count() / 1000 << "s)" << std::endl;
    // One thread per connection: a request sleeping between polls must not stall the others.
    unsigned int conn_timeout = static_cast<unsigned int>(cfg.poller.budget.count() / 1000 + 300);
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ERROR_LOG,
                                            static_cast<uint16_t>(cfg.port), nullptr, nullptr, &handler, &api,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_CONNECTION_TIMEOUT, conn_timeout,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[avatar] Failed to start HTTP server" << std::endl;
        curl_global_cleanup();
        return 1;
    }
    std::signal(SIGTERM, [](int) { g_stop = 1; });
    std::signal(SIGINT, [](int) { g_stop = 1; });
    while (!g_stop) pause();
    std::cout << "[avatar] Shutting down" << std::endl;
    MHD_stop_daemon(d);
    curl_global_cleanup();
    return 0;
}
