#pragma once
#include <string>
#include <map>
#include <memory>

// HTTP request structure
struct HttpRequest {
    std::string method{"GET"};    // GET, POST, PUT, DELETE
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeout_ms{0};            // 0 uses the handler default
    bool verify_ssl{true};
};

// HTTP response structure
struct HttpResponse {
    int status_code{0};
    std::map<std::string, std::string> headers;
    std::string body;
    std::string error_message;    // transport failure; empty when a status was received
    bool success{false};          // 2xx
};

/**
 * Blocking HTTP transport used by the venue gateways.
 *
 * Implementations must be safe to call from several threads; a call abandoned by a
 * circuit-breaker timeout may still be running when the next one starts.
 */
class IHttpHandler {
public:
    virtual ~IHttpHandler() = default;

    virtual HttpResponse make_request(const HttpRequest& request) = 0;

    // Lifecycle management
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool is_initialized() const = 0;

    // Configuration
    virtual void set_default_timeout(int timeout_ms) = 0;
    virtual void set_default_headers(const std::map<std::string, std::string>& headers) = 0;
    virtual void set_verify_ssl(bool verify) = 0;
};

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& value);

// HTTP handler factory
class HttpHandlerFactory {
public:
    enum class Type {
        CURL
    };

    // Returns an initialized handler; throws std::runtime_error if initialization fails
    static std::unique_ptr<IHttpHandler> create(Type type = Type::CURL);
};
