#pragma once
#include "i_http_handler.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <curl/curl.h>

// libcurl easy-handle transport; requests are serialized on one handle
class CurlHttpHandler : public IHttpHandler {
public:
    CurlHttpHandler();
    ~CurlHttpHandler() override;

    CurlHttpHandler(const CurlHttpHandler&) = delete;
    CurlHttpHandler& operator=(const CurlHttpHandler&) = delete;

    HttpResponse make_request(const HttpRequest& request) override;

    bool initialize() override;
    void shutdown() override;
    bool is_initialized() const override { return initialized_.load(); }

    void set_default_timeout(int timeout_ms) override;
    void set_default_headers(const std::map<std::string, std::string>& headers) override;
    void set_verify_ssl(bool verify) override;

private:
    struct WriteCallbackData {
        std::string* buffer;
        HttpResponse* response;
    };

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);
    static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data);

    // Returns the header list installed on the handle; caller frees it after the transfer
    curl_slist* setup_curl_options(const HttpRequest& request, WriteCallbackData& data);

    mutable std::mutex mutex_;
    CURL* curl_{nullptr};
    std::atomic<bool> initialized_{false};
    int default_timeout_ms_{5000};
    std::map<std::string, std::string> default_headers_;
    bool verify_ssl_{true};
};
