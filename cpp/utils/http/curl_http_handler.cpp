#include "curl_http_handler.hpp"
#include "../logging/log_helper.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace {

std::once_flag g_curl_global_once;

} // namespace

std::string url_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded.append(hex);
        }
    }
    return encoded;
}

std::unique_ptr<IHttpHandler> HttpHandlerFactory::create(HttpHandlerFactory::Type type) {
    switch (type) {
        case HttpHandlerFactory::Type::CURL: {
            auto handler = std::make_unique<CurlHttpHandler>();
            if (!handler->initialize()) {
                throw std::runtime_error("Failed to initialize CURL HTTP handler");
            }
            return handler;
        }
        default:
            throw std::runtime_error("Unknown HTTP handler type");
    }
}

CurlHttpHandler::CurlHttpHandler() {
    std::call_once(g_curl_global_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpHandler::~CurlHttpHandler() {
    shutdown();
}

bool CurlHttpHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            LOG_ERROR_COMP("HTTP", "Failed to initialize CURL handle");
            return false;
        }
    }

    initialized_.store(true);
    return true;
}

void CurlHttpHandler::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    initialized_.store(false);
}

void CurlHttpHandler::set_default_timeout(int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_timeout_ms_ = timeout_ms;
}

void CurlHttpHandler::set_default_headers(const std::map<std::string, std::string>& headers) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_headers_ = headers;
}

void CurlHttpHandler::set_verify_ssl(bool verify) {
    std::lock_guard<std::mutex> lock(mutex_);
    verify_ssl_ = verify;
}

HttpResponse CurlHttpHandler::make_request(const HttpRequest& request) {
    HttpResponse response;
    std::lock_guard<std::mutex> lock(mutex_);

    if (!curl_) {
        response.error_message = "HTTP handler not initialized";
        return response;
    }

    WriteCallbackData data;
    data.buffer = &response.body;
    data.response = &response;

    curl_easy_reset(curl_);
    curl_slist* header_list = setup_curl_options(request, data);

    CURLcode res = curl_easy_perform(curl_);
    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        response.error_message = "CURL error: " + std::string(curl_easy_strerror(res));
        LOG_DEBUG_COMP("HTTP", request.method + " " + request.url + " failed: " + response.error_message);
        return response;
    }

    long response_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);
    response.success = (response_code >= 200 && response_code < 300);

    LOG_DEBUG_COMP("HTTP", request.method + " " + request.url + " -> " + std::to_string(response.status_code));
    return response;
}

// Caller holds mutex_
curl_slist* CurlHttpHandler::setup_curl_options(const HttpRequest& request, WriteCallbackData& data) {
    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "tradedesk/1.0");
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "PUT" || request.method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    int timeout = request.timeout_ms > 0 ? request.timeout_ms : default_timeout_ms_;
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout));

    bool verify = request.verify_ssl && verify_ssl_;
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &data);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &data);

    // Request headers override defaults with the same name
    std::map<std::string, std::string> merged = default_headers_;
    for (const auto& [key, value] : request.headers) {
        merged[key] = value;
    }

    curl_slist* header_list = nullptr;
    for (const auto& [key, value] : merged) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }
    return header_list;
}

size_t CurlHttpHandler::WriteCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->buffer) return 0;

    size_t total_size = size * nmemb;
    data->buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpHandler::HeaderCallback(void* contents, size_t size, size_t nmemb, WriteCallbackData* data) {
    if (!data || !data->response) return 0;

    size_t total_size = size * nmemb;
    std::string header_line(static_cast<char*>(contents), total_size);

    while (!header_line.empty() && (header_line.back() == '\n' || header_line.back() == '\r')) {
        header_line.pop_back();
    }

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        data->response->headers[key] = value;
    }

    return total_size;
}
