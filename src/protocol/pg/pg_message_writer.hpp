//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_message_writer.hpp
//
// PostgreSQL message writer for frontend and synthesized backend messages
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/pg/pg_protocol.hpp"
#include <map>
#include <vector>
#include <string>
#include <cstring>

namespace pgmux {
namespace pg {

class PgMessageWriter {
public:
    PgMessageWriter() {
        buffer.reserve(1024);
    }

    const std::vector<uint8_t>& GetBuffer() const { return buffer; }
    std::vector<uint8_t> TakeBuffer() {
        std::vector<uint8_t> out = std::move(buffer);
        buffer.clear();
        return out;
    }

    void Clear() { buffer.clear(); }

    //===------------------------------------------------------------------===//
    // Frontend: startup phase (untagged)
    //===------------------------------------------------------------------===//
    void WriteStartupMessage(const std::map<std::string, std::string>& parameters) {
        StartUntaggedMessage();
        WriteInt32(PROTOCOL_VERSION_3_0);
        for (const auto& kv : parameters) {
            WriteString(kv.first);
            WriteString(kv.second);
        }
        WriteByte(0);
        EndMessage();
    }

    void WriteSSLRequest() {
        StartUntaggedMessage();
        WriteInt32(SSL_REQUEST_CODE);
        EndMessage();
    }

    void WriteCancelRequest(int32_t process_id, int32_t secret_key) {
        StartUntaggedMessage();
        WriteInt32(CANCEL_REQUEST_CODE);
        WriteInt32(process_id);
        WriteInt32(secret_key);
        EndMessage();
    }

    //===------------------------------------------------------------------===//
    // Frontend: authentication responses
    //===------------------------------------------------------------------===//
    void WritePasswordMessage(const std::string& password) {
        StartMessage(FrontendMessage::PasswordMessage);
        WriteString(password);
        EndMessage();
    }

    void WriteSASLInitialResponse(const std::string& mechanism, const std::string& data) {
        StartMessage(FrontendMessage::PasswordMessage);
        WriteString(mechanism);
        WriteInt32(static_cast<int32_t>(data.size()));
        WriteRawBytes(data.data(), data.size());
        EndMessage();
    }

    void WriteSASLResponse(const std::string& data) {
        StartMessage(FrontendMessage::PasswordMessage);
        WriteRawBytes(data.data(), data.size());
        EndMessage();
    }

    //===------------------------------------------------------------------===//
    // Frontend: queries
    //===------------------------------------------------------------------===//
    void WriteQuery(const std::string& sql) {
        StartMessage(FrontendMessage::Query);
        WriteString(sql);
        EndMessage();
    }

    void WriteSync() {
        StartMessage(FrontendMessage::Sync);
        EndMessage();
    }

    void WriteTerminate() {
        StartMessage(FrontendMessage::Terminate);
        EndMessage();
    }

    //===------------------------------------------------------------------===//
    // Backend: messages synthesized by the proxy
    //===------------------------------------------------------------------===//
    void WriteAuthenticationOk() {
        StartMessage(BackendMessage::Authentication);
        WriteInt32(AuthType::Ok);
        EndMessage();
    }

    void WriteAuthenticationRequest(int32_t type, const std::vector<uint8_t>& extra = {}) {
        StartMessage(BackendMessage::Authentication);
        WriteInt32(type);
        WriteBytes(extra.data(), extra.size());
        EndMessage();
    }

    void WriteNegotiateProtocolVersion(int32_t newest_minor,
                                       const std::vector<std::string>& unrecognized_options) {
        StartMessage(BackendMessage::NegotiateProtocolVersion);
        WriteInt32(newest_minor);
        WriteInt32(static_cast<int32_t>(unrecognized_options.size()));
        for (const auto& option : unrecognized_options) {
            WriteString(option);
        }
        EndMessage();
    }

    void WriteParameterStatus(const std::string& name, const std::string& value) {
        StartMessage(BackendMessage::ParameterStatus);
        WriteString(name);
        WriteString(value);
        EndMessage();
    }

    void WriteBackendKeyData(int32_t process_id, int32_t secret_key) {
        StartMessage(BackendMessage::BackendKeyData);
        WriteInt32(process_id);
        WriteInt32(secret_key);
        EndMessage();
    }

    void WriteReadyForQuery(char transaction_status) {
        StartMessage(BackendMessage::ReadyForQuery);
        WriteByte(static_cast<uint8_t>(transaction_status));
        EndMessage();
    }

    void WriteCommandComplete(const std::string& tag) {
        StartMessage(BackendMessage::CommandComplete);
        WriteString(tag);
        EndMessage();
    }

    void WriteErrorResponse(const std::string& severity,
                            const std::string& code,
                            const std::string& message,
                            const std::string& detail = "",
                            const std::string& hint = "") {
        StartMessage(BackendMessage::ErrorResponse);
        WriteField(ErrorField::Severity, severity);
        WriteField(ErrorField::SeverityNonLocalized, severity);
        WriteField(ErrorField::Code, code);
        WriteField(ErrorField::Message, message);
        if (!detail.empty()) {
            WriteField(ErrorField::Detail, detail);
        }
        if (!hint.empty()) {
            WriteField(ErrorField::Hint, hint);
        }
        WriteByte(0);
        EndMessage();
    }

    void WriteNoticeResponse(const std::string& severity,
                             const std::string& code,
                             const std::string& message) {
        StartMessage(BackendMessage::NoticeResponse);
        WriteField(ErrorField::Severity, severity);
        WriteField(ErrorField::Code, code);
        WriteField(ErrorField::Message, message);
        WriteByte(0);
        EndMessage();
    }

private:
    void StartMessage(char type) {
        buffer.push_back(static_cast<uint8_t>(type));
        length_pos = buffer.size();
        buffer.resize(buffer.size() + 4);
    }

    void StartUntaggedMessage() {
        length_pos = buffer.size();
        buffer.resize(buffer.size() + 4);
    }

    void EndMessage() {
        // Length covers itself and the body, never the type byte
        int32_t length = static_cast<int32_t>(buffer.size() - length_pos);
        int32_t network_length = HostToNetwork32(length);
        std::memcpy(buffer.data() + length_pos, &network_length, 4);
    }

    void WriteByte(uint8_t value) {
        buffer.push_back(value);
    }

    void WriteBytes(const uint8_t* bytes, size_t n) {
        buffer.insert(buffer.end(), bytes, bytes + n);
    }

    void WriteRawBytes(const char* bytes, size_t n) {
        buffer.insert(buffer.end(), bytes, bytes + n);
    }

    void WriteInt32(int32_t value) {
        int32_t network_value = HostToNetwork32(value);
        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(&network_value);
        buffer.insert(buffer.end(), ptr, ptr + 4);
    }

    void WriteString(const std::string& str) {
        buffer.insert(buffer.end(), str.begin(), str.end());
        buffer.push_back(0);
    }

    void WriteField(char field_type, const std::string& value) {
        buffer.push_back(static_cast<uint8_t>(field_type));
        WriteString(value);
    }

private:
    std::vector<uint8_t> buffer;
    size_t length_pos = 0;
};

} // namespace pg
} // namespace pgmux
