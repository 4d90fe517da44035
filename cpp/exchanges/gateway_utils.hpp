#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <json/json.h>

// Helpers shared by the REST venue gateways
namespace exchanges {

// Lowercase hex HMAC-SHA256
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// Throws error_handling::ExchangeError naming the venue when the body is not JSON
Json::Value parse_json(const std::string& body, const std::string& exchange);
std::string write_json(const Json::Value& value);

// Venues send numbers as strings or numbers; missing/empty/invalid yields fallback
double json_double(const Json::Value& node, const char* key, double fallback = 0.0);
std::string json_string(const Json::Value& node, const char* key);
// Strict form for values that must be present, e.g. order book levels; throws ExchangeError
double json_number(const Json::Value& value, const std::string& exchange);

int64_t now_millis();
std::chrono::system_clock::time_point from_millis(int64_t millis);
// RFC 3339 UTC timestamp ("2024-01-01T12:00:00.123Z"); now() when unparseable
std::chrono::system_clock::time_point parse_iso8601(const std::string& value);

} // namespace exchanges
