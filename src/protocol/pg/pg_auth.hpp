//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_auth.hpp
//
// Client-side password authentication (MD5, SCRAM-SHA-256) using OpenSSL
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pgmux {
namespace pg {

constexpr const char* SCRAM_SHA_256 = "SCRAM-SHA-256";

// "md5" + md5hex(md5hex(password + user) + salt)
std::string ComputeMD5Password(const std::string& user,
                               const std::string& password,
                               const uint8_t salt[4]);

std::string Base64Encode(const uint8_t* data, size_t len);
bool Base64Decode(const std::string& text, std::vector<uint8_t>& out);

// Random printable nonce from a cryptographic source
std::string GenerateNonce(size_t raw_bytes = 18);

//===----------------------------------------------------------------------===//
// ScramSha256Client - RFC 5802 / RFC 7677 client exchange without channel
// binding. PostgreSQL ignores the SCRAM user name, so it is normally empty.
//===----------------------------------------------------------------------===//
class ScramSha256Client {
public:
    ScramSha256Client(std::string user, std::string password,
                      std::string client_nonce = "");

    // client-first-message, sent in SASLInitialResponse
    std::string ClientFirstMessage() const;

    // Consume server-first-message, produce client-final-message
    bool HandleServerFirst(const std::string& server_first,
                           std::string& client_final,
                           std::string& error);

    // Check the server signature in server-final-message
    bool VerifyServerFinal(const std::string& server_final, std::string& error) const;

private:
    std::string ClientFirstBare() const;

private:
    std::string user_;
    std::string password_;
    std::string client_nonce_;
    std::vector<uint8_t> expected_server_signature_;
    bool have_server_first_ = false;
};

} // namespace pg
} // namespace pgmux
