//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_auth.cpp
//
// Password authentication helpers
//===----------------------------------------------------------------------===//

#include "protocol/pg/pg_auth.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <stdexcept>

namespace pgmux {
namespace pg {

namespace {

constexpr size_t SHA256_LEN = 32;

std::string ToHex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string MD5Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    return ToHex(digest, digest_len);
}

std::vector<uint8_t> HmacSha256(const std::vector<uint8_t>& key, const std::string& message) {
    std::vector<uint8_t> out(SHA256_LEN);
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              out.data(), &out_len)) {
        throw std::runtime_error("HMAC-SHA-256 failed");
    }
    out.resize(out_len);
    return out;
}

std::vector<uint8_t> Sha256(const std::vector<uint8_t>& input) {
    std::vector<uint8_t> out(SHA256_LEN);
    unsigned int out_len = 0;
    if (EVP_Digest(input.data(), input.size(), out.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    out.resize(out_len);
    return out;
}

// SCRAM attribute escaping for the user name ("=" and "," are reserved)
std::string EscapeSaslName(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '=') {
            out += "=3D";
        } else if (c == ',') {
            out += "=2C";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Split "a=x,b=y" into attribute/value pairs; false on malformed input
bool ParseAttributes(const std::string& message,
                     std::vector<std::pair<char, std::string>>& attributes) {
    size_t start = 0;
    while (start <= message.size()) {
        size_t end = message.find(',', start);
        if (end == std::string::npos) {
            end = message.size();
        }
        std::string part = message.substr(start, end - start);
        if (part.size() < 2 || part[1] != '=') {
            return false;
        }
        attributes.emplace_back(part[0], part.substr(2));
        start = end + 1;
    }
    return !attributes.empty();
}

} // anonymous namespace

std::string ComputeMD5Password(const std::string& user,
                               const std::string& password,
                               const uint8_t salt[4]) {
    std::string inner = MD5Hex(password + user);
    inner.append(reinterpret_cast<const char*>(salt), 4);
    return "md5" + MD5Hex(inner);
}

std::string Base64Encode(const uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

bool Base64Decode(const std::string& text, std::vector<uint8_t>& out) {
    if (text.size() % 4 != 0) {
        return false;
    }
    out.assign(text.size() / 4 * 3 + 1, 0);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return false;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (!text.empty() && text[text.size() - 1] == '=') padding++;
    if (text.size() > 1 && text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return true;
}

std::string GenerateNonce(size_t raw_bytes) {
    std::vector<uint8_t> raw(raw_bytes);
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return Base64Encode(raw.data(), raw.size());
}

//===----------------------------------------------------------------------===//
// ScramSha256Client
//===----------------------------------------------------------------------===//

ScramSha256Client::ScramSha256Client(std::string user, std::string password,
                                     std::string client_nonce)
    : user_(std::move(user))
    , password_(std::move(password))
    , client_nonce_(client_nonce.empty() ? GenerateNonce() : std::move(client_nonce)) {
}

std::string ScramSha256Client::ClientFirstBare() const {
    return "n=" + EscapeSaslName(user_) + ",r=" + client_nonce_;
}

std::string ScramSha256Client::ClientFirstMessage() const {
    // gs2 header: no channel binding, no authzid
    return "n,," + ClientFirstBare();
}

bool ScramSha256Client::HandleServerFirst(const std::string& server_first,
                                          std::string& client_final,
                                          std::string& error) {
    std::vector<std::pair<char, std::string>> attributes;
    if (!ParseAttributes(server_first, attributes)) {
        error = "malformed SCRAM server-first-message";
        return false;
    }

    std::string nonce;
    std::string salt_b64;
    int iterations = 0;
    for (const auto& attr : attributes) {
        switch (attr.first) {
            case 'r': nonce = attr.second; break;
            case 's': salt_b64 = attr.second; break;
            case 'i':
                try {
                    iterations = std::stoi(attr.second);
                } catch (const std::exception&) {
                    iterations = 0;
                }
                break;
            case 'm':
                error = "unsupported SCRAM extension";
                return false;
            default:
                break;
        }
    }

    if (nonce.size() <= client_nonce_.size() ||
        nonce.compare(0, client_nonce_.size(), client_nonce_) != 0) {
        error = "SCRAM server nonce does not extend the client nonce";
        return false;
    }
    std::vector<uint8_t> salt;
    if (salt_b64.empty() || !Base64Decode(salt_b64, salt)) {
        error = "invalid SCRAM salt";
        return false;
    }
    if (iterations <= 0) {
        error = "invalid SCRAM iteration count";
        return false;
    }

    std::vector<uint8_t> salted_password(SHA256_LEN);
    if (PKCS5_PBKDF2_HMAC(password_.data(), static_cast<int>(password_.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(salted_password.size()),
                          salted_password.data()) != 1) {
        error = "PBKDF2 failed";
        return false;
    }

    std::vector<uint8_t> client_key = HmacSha256(salted_password, "Client Key");
    std::vector<uint8_t> stored_key = Sha256(client_key);

    // "biws" = base64("n,,")
    std::string final_without_proof = "c=biws,r=" + nonce;
    std::string auth_message = ClientFirstBare() + "," + server_first + "," + final_without_proof;

    std::vector<uint8_t> client_signature = HmacSha256(stored_key, auth_message);
    std::vector<uint8_t> proof(client_key.size());
    for (size_t i = 0; i < proof.size(); i++) {
        proof[i] = client_key[i] ^ client_signature[i];
    }

    std::vector<uint8_t> server_key = HmacSha256(salted_password, "Server Key");
    expected_server_signature_ = HmacSha256(server_key, auth_message);
    have_server_first_ = true;

    client_final = final_without_proof + ",p=" + Base64Encode(proof.data(), proof.size());
    return true;
}

bool ScramSha256Client::VerifyServerFinal(const std::string& server_final,
                                          std::string& error) const {
    if (!have_server_first_) {
        error = "SCRAM server-final-message before server-first-message";
        return false;
    }

    std::vector<std::pair<char, std::string>> attributes;
    if (!ParseAttributes(server_final, attributes)) {
        error = "malformed SCRAM server-final-message";
        return false;
    }

    for (const auto& attr : attributes) {
        if (attr.first == 'e') {
            error = "SCRAM authentication rejected: " + attr.second;
            return false;
        }
        if (attr.first == 'v') {
            std::vector<uint8_t> signature;
            if (!Base64Decode(attr.second, signature) ||
                signature.size() != expected_server_signature_.size() ||
                CRYPTO_memcmp(signature.data(), expected_server_signature_.data(),
                              signature.size()) != 0) {
                error = "SCRAM server signature mismatch";
                return false;
            }
            return true;
        }
    }

    error = "SCRAM server-final-message has no verifier";
    return false;
}

} // namespace pg
} // namespace pgmux
