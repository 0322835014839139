#include "google_service_account_auth.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <memory>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace ReinvestTrader {
namespace API {

namespace {

constexpr long long TOKEN_LIFETIME_SECONDS = 3600;
constexpr long long TOKEN_REFRESH_MARGIN_SECONDS = 60;
const char* const JWT_BEARER_GRANT_TYPE = "urn:ietf:params:oauth:grant-type:jwt-bearer";

std::string last_openssl_error() {
    unsigned long openssl_error_code = ERR_get_error();
    if (openssl_error_code == 0) {
        return "unknown OpenSSL error";
    }
    char error_buffer[256];
    ERR_error_string_n(openssl_error_code, error_buffer, sizeof(error_buffer));
    return std::string(error_buffer);
}

std::string read_required_string(const json& key_json, const std::string& field_name) {
    if (!key_json.contains(field_name) || !key_json[field_name].is_string()) {
        throw std::runtime_error("Service account key is missing '" + field_name + "'");
    }
    return key_json[field_name].get<std::string>();
}

} // anonymous namespace

GoogleServiceAccountAuth::GoogleServiceAccountAuth(const std::string& service_account_json, const std::string& scope, int request_timeout_seconds)
    : oauth_scope(scope), timeout_seconds(request_timeout_seconds), cached_token_expiry_unix_seconds(0) {
    if (service_account_json.empty()) {
        throw std::runtime_error("Google service account credentials are required but not provided");
    }

    json key_json;
    try {
        key_json = json::parse(service_account_json);
    } catch (const json::exception& parse_exception_error) {
        throw std::runtime_error("Google service account credentials are not valid JSON: " + std::string(parse_exception_error.what()));
    }

    client_email = read_required_string(key_json, "client_email");
    private_key_pem = read_required_string(key_json, "private_key");
    token_uri = key_json.value("token_uri", "https://oauth2.googleapis.com/token");
}

std::string GoogleServiceAccountAuth::get_access_token() {
    long long now_unix_seconds = TimeUtils::get_current_unix_seconds();
    if (!cached_access_token.empty() && now_unix_seconds + TOKEN_REFRESH_MARGIN_SECONDS < cached_token_expiry_unix_seconds) {
        return cached_access_token;
    }

    long long expiry_unix_seconds = 0;
    cached_access_token = request_access_token(now_unix_seconds, expiry_unix_seconds);
    cached_token_expiry_unix_seconds = expiry_unix_seconds;
    return cached_access_token;
}

std::string GoogleServiceAccountAuth::request_access_token(long long issued_at_unix_seconds, long long& expiry_unix_seconds) const {
    std::string form_body = "grant_type=" + url_encode(JWT_BEARER_GRANT_TYPE) +
                            "&assertion=" + url_encode(build_signed_assertion(issued_at_unix_seconds));

    HttpRequest token_request(token_uri, {"Content-Type: application/x-www-form-urlencoded"}, 3, timeout_seconds, true, 0, form_body);
    HttpResponse token_response = http_post(token_request);
    if (!token_response.is_success()) {
        throw std::runtime_error("Google token exchange failed with HTTP " + std::to_string(token_response.status_code) +
                                 ": " + token_response.body.substr(0, 200));
    }

    json token_json;
    try {
        token_json = json::parse(token_response.body);
    } catch (const json::exception& parse_exception_error) {
        throw std::runtime_error("Failed to parse Google token response: " + std::string(parse_exception_error.what()));
    }

    if (!token_json.contains("access_token") || !token_json["access_token"].is_string()) {
        throw std::runtime_error("Google token response missing access_token");
    }

    expiry_unix_seconds = issued_at_unix_seconds + token_json.value("expires_in", TOKEN_LIFETIME_SECONDS);
    return token_json["access_token"].get<std::string>();
}

std::string GoogleServiceAccountAuth::build_signed_assertion(long long issued_at_unix_seconds) const {
    json header_json = {{"alg", "RS256"}, {"typ", "JWT"}};
    json claims_json = {
        {"iss", client_email},
        {"scope", oauth_scope},
        {"aud", token_uri},
        {"iat", issued_at_unix_seconds},
        {"exp", issued_at_unix_seconds + TOKEN_LIFETIME_SECONDS}
    };

    std::string signing_input = base64_url_encode(header_json.dump()) + "." + base64_url_encode(claims_json.dump());
    return signing_input + "." + base64_url_encode(sign_rs256(signing_input, private_key_pem));
}

std::string GoogleServiceAccountAuth::base64_url_encode(const std::string& raw_bytes) {
    BIO* base64_filter = BIO_new(BIO_f_base64());
    BIO* memory_sink = BIO_new(BIO_s_mem());
    if (!base64_filter || !memory_sink) {
        BIO_free(base64_filter);
        BIO_free(memory_sink);
        throw std::runtime_error("Failed to allocate OpenSSL BIO for base64 encoding");
    }
    BIO_set_flags(base64_filter, BIO_FLAGS_BASE64_NO_NL);
    BIO_push(base64_filter, memory_sink);
    BIO_write(base64_filter, raw_bytes.data(), static_cast<int>(raw_bytes.size()));
    BIO_flush(base64_filter);

    BUF_MEM* memory_buffer = nullptr;
    BIO_get_mem_ptr(memory_sink, &memory_buffer);
    std::string encoded(memory_buffer->data, memory_buffer->length);
    BIO_free_all(base64_filter);

    // RFC 7515 base64url: swap the two non-URL-safe characters and drop padding
    for (char& encoded_char : encoded) {
        if (encoded_char == '+') encoded_char = '-';
        else if (encoded_char == '/') encoded_char = '_';
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string GoogleServiceAccountAuth::sign_rs256(const std::string& signing_input, const std::string& private_key_pem_text) {
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(
        BIO_new_mem_buf(private_key_pem_text.data(), static_cast<int>(private_key_pem_text.size())), &BIO_free);
    if (!key_bio) {
        throw std::runtime_error("Failed to allocate OpenSSL BIO for private key");
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> private_key(
        PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
    if (!private_key) {
        throw std::runtime_error("Failed to read service account private key: " + last_openssl_error());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> digest_context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!digest_context) {
        throw std::runtime_error("Failed to allocate OpenSSL digest context");
    }

    if (EVP_DigestSignInit(digest_context.get(), nullptr, EVP_sha256(), nullptr, private_key.get()) != 1 ||
        EVP_DigestSignUpdate(digest_context.get(), signing_input.data(), signing_input.size()) != 1) {
        throw std::runtime_error("Failed to initialize RS256 signature: " + last_openssl_error());
    }

    size_t signature_length = 0;
    if (EVP_DigestSignFinal(digest_context.get(), nullptr, &signature_length) != 1) {
        throw std::runtime_error("Failed to size RS256 signature: " + last_openssl_error());
    }

    std::vector<unsigned char> signature_bytes(signature_length);
    if (EVP_DigestSignFinal(digest_context.get(), signature_bytes.data(), &signature_length) != 1) {
        throw std::runtime_error("Failed to produce RS256 signature: " + last_openssl_error());
    }

    return std::string(reinterpret_cast<const char*>(signature_bytes.data()), signature_length);
}

} // namespace API
} // namespace ReinvestTrader
