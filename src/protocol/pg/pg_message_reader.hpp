//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_message_reader.hpp
//
// Typed payload parsers for PostgreSQL messages
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/pg/pg_protocol.hpp"
#include <parallel_hashmap/phmap.h>
#include <vector>
#include <string>
#include <cstring>

namespace pgmux {
namespace pg {

//===----------------------------------------------------------------------===//
// Startup Message (also SSLRequest / CancelRequest)
//===----------------------------------------------------------------------===//
struct StartupMessage {
    int32_t protocol_version = 0;
    int32_t cancel_pid = 0;
    int32_t cancel_secret_key = 0;
    phmap::flat_hash_map<std::string, std::string> parameters;

    std::string GetParameter(const std::string& key, const std::string& default_val = "") const {
        auto it = parameters.find(key);
        return it != parameters.end() ? it->second : default_val;
    }

    std::string GetUser() const { return GetParameter("user"); }

    // The server defaults the database name to the user name
    std::string GetDatabase() const {
        std::string db = GetParameter("database");
        return db.empty() ? GetUser() : db;
    }

    bool IsSSLRequest() const { return protocol_version == SSL_REQUEST_CODE; }
    bool IsGSSEncRequest() const { return protocol_version == GSSENC_REQUEST_CODE; }
    bool IsCancelRequest() const { return protocol_version == CANCEL_REQUEST_CODE; }
};

//===----------------------------------------------------------------------===//
// Authentication request ('R')
//===----------------------------------------------------------------------===//
struct AuthenticationRequest {
    int32_t type = 0;
    std::vector<uint8_t> data;  // salt for MD5, mechanism list / SASL data otherwise
};

//===----------------------------------------------------------------------===//
// Error / Notice fields
//===----------------------------------------------------------------------===//
struct ErrorFields {
    phmap::flat_hash_map<char, std::string> fields;

    std::string Get(char field) const {
        auto it = fields.find(field);
        return it != fields.end() ? it->second : std::string();
    }

    std::string Severity() const {
        std::string s = Get(ErrorField::SeverityNonLocalized);
        return s.empty() ? Get(ErrorField::Severity) : s;
    }
    std::string Code() const { return Get(ErrorField::Code); }
    std::string Message() const { return Get(ErrorField::Message); }

    // FATAL and PANIC terminate the backend session
    bool IsFatal() const {
        std::string s = Severity();
        return s == "FATAL" || s == "PANIC";
    }

    std::string ToString() const {
        return Severity() + " " + Code() + ": " + Message();
    }
};

//===----------------------------------------------------------------------===//
// Message Reader - operates on a frame payload (length prefix stripped)
//===----------------------------------------------------------------------===//
class PgMessageReader {
public:
    PgMessageReader(const uint8_t* data_p, size_t len_p)
        : data(data_p), len(len_p), pos(0) {}

    explicit PgMessageReader(const std::vector<uint8_t>& payload)
        : data(payload.data()), len(payload.size()), pos(0) {}

    bool HasRemaining(size_t bytes = 1) const {
        return pos + bytes <= len;
    }

    size_t Remaining() const {
        return len - pos;
    }

    //===------------------------------------------------------------------===//
    // Startup Message
    //===------------------------------------------------------------------===//
    bool ReadStartupMessage(StartupMessage& msg) {
        if (!HasRemaining(4)) return false;
        msg.protocol_version = ReadInt32();

        if (msg.IsSSLRequest() || msg.IsGSSEncRequest()) {
            return true;
        }

        if (msg.IsCancelRequest()) {
            if (!HasRemaining(8)) return false;
            msg.cancel_pid = ReadInt32();
            msg.cancel_secret_key = ReadInt32();
            return true;
        }

        while (HasRemaining() && data[pos] != 0) {
            std::string key;
            std::string value;
            if (!ReadString(key) || !ReadString(value)) return false;
            msg.parameters[key] = value;
        }

        // Parameter list must end with a null byte
        if (!HasRemaining()) return false;
        pos++;
        return true;
    }

    //===------------------------------------------------------------------===//
    // Backend messages consumed during the handshake
    //===------------------------------------------------------------------===//
    bool ReadAuthenticationRequest(AuthenticationRequest& msg) {
        if (!HasRemaining(4)) return false;
        msg.type = ReadInt32();
        msg.data.assign(data + pos, data + len);
        pos = len;
        return true;
    }

    bool ReadParameterStatus(std::string& name, std::string& value) {
        return ReadString(name) && ReadString(value);
    }

    bool ReadBackendKeyData(int32_t& process_id, int32_t& secret_key) {
        if (!HasRemaining(8)) return false;
        process_id = ReadInt32();
        secret_key = ReadInt32();
        return true;
    }

    bool ReadReadyForQuery(char& transaction_status) {
        if (!HasRemaining(1)) return false;
        transaction_status = static_cast<char>(ReadByte());
        return transaction_status == TransactionStatus::Idle ||
               transaction_status == TransactionStatus::InTransaction ||
               transaction_status == TransactionStatus::Failed;
    }

    bool ReadErrorFields(ErrorFields& msg) {
        while (HasRemaining()) {
            char field = static_cast<char>(ReadByte());
            if (field == 0) {
                return true;
            }
            std::string value;
            if (!ReadString(value)) return false;
            msg.fields[field] = std::move(value);
        }
        return false;  // missing terminator
    }

    //===------------------------------------------------------------------===//
    // Frontend messages inspected by the proxy
    //===------------------------------------------------------------------===//
    bool ReadQuery(std::string& query) {
        return ReadString(query);
    }

    // SASL mechanism list: strings terminated by an empty string
    bool ReadSaslMechanisms(std::vector<std::string>& mechanisms) {
        while (HasRemaining()) {
            std::string mechanism;
            if (!ReadString(mechanism)) return false;
            if (mechanism.empty()) return true;
            mechanisms.push_back(std::move(mechanism));
        }
        return false;
    }

private:
    uint8_t ReadByte() {
        return data[pos++];
    }

    int32_t ReadInt32() {
        int32_t value;
        std::memcpy(&value, data + pos, 4);
        pos += 4;
        return NetworkToHost32(value);
    }

    bool ReadString(std::string& out) {
        if (!HasRemaining()) return false;
        const char* start = reinterpret_cast<const char*>(data + pos);
        size_t slen = strnlen(start, len - pos);
        if (slen == len - pos) {
            return false;  // no null terminator
        }
        out.assign(start, slen);
        pos += slen + 1;
        return true;
    }

private:
    const uint8_t* data;
    size_t len;
    size_t pos;
};

} // namespace pg
} // namespace pgmux
