//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// pool/connection_key.hpp
//
// Identity of a backend session shape (user, database, startup parameters)
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/pg/pg_message_reader.hpp"
#include <parallel_hashmap/phmap.h>
#include <parallel_hashmap/phmap_utils.h>
#include <map>
#include <string>

namespace pgmux {

struct ConnectionKey {
    std::string user;
    std::string database;
    // Every startup parameter other than user and database, ordered by name.
    // Protocol extension options ("_pq_.*") never reach the backend.
    std::map<std::string, std::string> startup_parameters;

    ConnectionKey() = default;
    ConnectionKey(std::string user_p, std::string database_p,
                  std::map<std::string, std::string> params_p = {})
        : user(std::move(user_p))
        , database(std::move(database_p))
        , startup_parameters(std::move(params_p)) {}

    static ConnectionKey FromStartup(const pg::StartupMessage& msg) {
        ConnectionKey key(msg.GetUser(), msg.GetDatabase());
        for (const auto& kv : msg.parameters) {
            if (kv.first != "user" && kv.first != "database" &&
                kv.first.compare(0, 5, "_pq_.") != 0) {
                key.startup_parameters.emplace(kv.first, kv.second);
            }
        }
        return key;
    }

    // Parameters for the backend StartupMessage
    std::map<std::string, std::string> ToStartupParameters() const {
        std::map<std::string, std::string> params = startup_parameters;
        params["user"] = user;
        params["database"] = database;
        return params;
    }

    std::string ToString() const {
        std::string out = user + "@" + database;
        if (!startup_parameters.empty()) {
            out += "{";
            bool first = true;
            for (const auto& kv : startup_parameters) {
                if (!first) out += ",";
                out += kv.first + "=" + kv.second;
                first = false;
            }
            out += "}";
        }
        return out;
    }

    bool operator==(const ConnectionKey& other) const {
        return user == other.user && database == other.database &&
               startup_parameters == other.startup_parameters;
    }
    bool operator!=(const ConnectionKey& other) const { return !(*this == other); }

    friend size_t hash_value(const ConnectionKey& key) {
        size_t seed = phmap::HashState().combine(0, key.user, key.database);
        for (const auto& kv : key.startup_parameters) {
            seed = phmap::HashState().combine(seed, kv.first, kv.second);
        }
        return seed;
    }
};

struct ConnectionKeyHash {
    size_t operator()(const ConnectionKey& key) const { return hash_value(key); }
};

} // namespace pgmux
