//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// backend/credential_provider.hpp
//
// Passwords the proxy presents when authenticating to the backend
//===----------------------------------------------------------------------===//

#pragma once

#include "pool/connection_key.hpp"
#include <map>
#include <string>

namespace pgmux {

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    // Password for the backend session of this key; empty when none is configured
    virtual std::string GetPassword(const ConnectionKey& key) const = 0;
};

class StaticCredentialProvider : public CredentialProvider {
public:
    StaticCredentialProvider() = default;
    StaticCredentialProvider(std::string default_password,
                             std::map<std::string, std::string> user_passwords)
        : default_password_(std::move(default_password))
        , user_passwords_(std::move(user_passwords)) {}

    std::string GetPassword(const ConnectionKey& key) const override {
        auto it = user_passwords_.find(key.user);
        return it != user_passwords_.end() ? it->second : default_password_;
    }

private:
    std::string default_password_;
    std::map<std::string, std::string> user_passwords_;
};

} // namespace pgmux
