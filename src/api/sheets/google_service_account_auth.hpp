#ifndef GOOGLE_SERVICE_ACCOUNT_AUTH_HPP
#define GOOGLE_SERVICE_ACCOUNT_AUTH_HPP

#include "configs/sheets_config.hpp"
#include <string>

namespace ReinvestTrader {
namespace API {

/**
 * OAuth 2.0 service-account flow for Google APIs.
 * Signs an RS256 JWT assertion with the key file's private key and exchanges
 * it at the key file's token_uri for a bearer token, cached until shortly
 * before expiry.
 */
class GoogleServiceAccountAuth {
private:
    std::string client_email;
    std::string private_key_pem;
    std::string token_uri;
    std::string oauth_scope;
    int timeout_seconds;

    std::string cached_access_token;
    long long cached_token_expiry_unix_seconds;

    std::string request_access_token(long long issued_at_unix_seconds, long long& expiry_unix_seconds) const;

public:
    GoogleServiceAccountAuth(const std::string& service_account_json, const std::string& scope, int request_timeout_seconds);

    // Bearer token for the Authorization header, refreshed when stale
    std::string get_access_token();

    const std::string& get_client_email() const { return client_email; }

    std::string build_signed_assertion(long long issued_at_unix_seconds) const;

    static std::string base64_url_encode(const std::string& raw_bytes);
    static std::string sign_rs256(const std::string& signing_input, const std::string& private_key_pem_text);
};

} // namespace API
} // namespace ReinvestTrader

#endif // GOOGLE_SERVICE_ACCOUNT_AUTH_HPP
