#include "gateway_utils.hpp"
#include "../utils/error_handling.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace exchanges {

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &digest_len);

    std::string hex;
    hex.reserve(digest_len * 2);
    char byte[3];
    for (unsigned int i = 0; i < digest_len; ++i) {
        std::snprintf(byte, sizeof(byte), "%02x", static_cast<unsigned int>(digest[i]));
        hex.append(byte, 2);
    }
    return hex;
}

Json::Value parse_json(const std::string& body, const std::string& exchange) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw error_handling::ExchangeError(exchange, "Invalid JSON response: " + errors);
    }
    return root;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

double json_double(const Json::Value& node, const char* key, double fallback) {
    if (!node.isObject() || !node.isMember(key)) {
        return fallback;
    }
    const Json::Value& value = node[key];
    if (value.isNumeric()) {
        return value.asDouble();
    }
    if (value.isString()) {
        const std::string text = value.asString();
        if (text.empty()) {
            return fallback;
        }
        try {
            return std::stod(text);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

double json_number(const Json::Value& value, const std::string& exchange) {
    if (value.isNumeric()) {
        return value.asDouble();
    }
    if (value.isString()) {
        const std::string text = value.asString();
        size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(text, &consumed);
        } catch (const std::exception&) {
            throw error_handling::ExchangeError(exchange, "Malformed number in response: '" + text + "'");
        }
        if (consumed != text.size()) {
            throw error_handling::ExchangeError(exchange, "Malformed number in response: '" + text + "'");
        }
        return parsed;
    }
    throw error_handling::ExchangeError(exchange, "Malformed number in response");
}

std::string json_string(const Json::Value& node, const char* key) {
    if (!node.isObject() || !node.isMember(key) || node[key].isNull()) {
        return "";
    }
    const Json::Value& value = node[key];
    if (value.isString()) {
        return value.asString();
    }
    if (value.isIntegral()) {
        return std::to_string(value.asLargestInt());
    }
    return value.asString();
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& value) {
    std::tm tm{};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::chrono::system_clock::now();
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    auto dot = value.find('.');
    if (dot != std::string::npos) {
        std::string fraction;
        for (size_t i = dot + 1; i < value.size() && std::isdigit(static_cast<unsigned char>(value[i])); ++i) {
            fraction.push_back(value[i]);
        }
        fraction = fraction.substr(0, 6);
        while (fraction.size() < 6) fraction.push_back('0');
        tp += std::chrono::microseconds(std::stoll(fraction));
    }
    return tp;
}

} // namespace exchanges
