//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// protocol/pg/pg_protocol.hpp
//
// PostgreSQL wire protocol constants and utilities
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <arpa/inet.h>

namespace pgmux {
namespace pg {

//===----------------------------------------------------------------------===//
// Protocol Version
//===----------------------------------------------------------------------===//
constexpr int32_t PROTOCOL_VERSION_3_0 = 196608;  // 3.0 = (3 << 16) | 0
constexpr int32_t SSL_REQUEST_CODE = 80877103;
constexpr int32_t GSSENC_REQUEST_CODE = 80877104;
constexpr int32_t CANCEL_REQUEST_CODE = 80877102;

inline int32_t ProtocolMajor(int32_t version) { return version >> 16; }
inline int32_t ProtocolMinor(int32_t version) { return version & 0xFFFF; }

//===----------------------------------------------------------------------===//
// Message Types (Backend -> Frontend)
//===----------------------------------------------------------------------===//
namespace BackendMessage {
    constexpr char Authentication = 'R';
    constexpr char BackendKeyData = 'K';
    constexpr char BindComplete = '2';
    constexpr char CloseComplete = '3';
    constexpr char CommandComplete = 'C';
    constexpr char CopyData = 'd';
    constexpr char CopyDone = 'c';
    constexpr char CopyInResponse = 'G';
    constexpr char CopyOutResponse = 'H';
    constexpr char CopyBothResponse = 'W';
    constexpr char DataRow = 'D';
    constexpr char EmptyQueryResponse = 'I';
    constexpr char ErrorResponse = 'E';
    constexpr char FunctionCallResponse = 'V';
    constexpr char NegotiateProtocolVersion = 'v';
    constexpr char NoData = 'n';
    constexpr char NoticeResponse = 'N';
    constexpr char NotificationResponse = 'A';
    constexpr char ParameterDescription = 't';
    constexpr char ParameterStatus = 'S';
    constexpr char ParseComplete = '1';
    constexpr char PortalSuspended = 's';
    constexpr char ReadyForQuery = 'Z';
    constexpr char RowDescription = 'T';
}

//===----------------------------------------------------------------------===//
// Message Types (Frontend -> Backend)
//===----------------------------------------------------------------------===//
namespace FrontendMessage {
    constexpr char Bind = 'B';
    constexpr char Close = 'C';
    constexpr char CopyData = 'd';
    constexpr char CopyDone = 'c';
    constexpr char CopyFail = 'f';
    constexpr char Describe = 'D';
    constexpr char Execute = 'E';
    constexpr char Flush = 'H';
    constexpr char FunctionCall = 'F';
    constexpr char Parse = 'P';
    constexpr char PasswordMessage = 'p';  // also SASLInitialResponse / SASLResponse
    constexpr char Query = 'Q';
    constexpr char Sync = 'S';
    constexpr char Terminate = 'X';
}

//===----------------------------------------------------------------------===//
// Authentication Types
//===----------------------------------------------------------------------===//
namespace AuthType {
    constexpr int32_t Ok = 0;
    constexpr int32_t KerberosV5 = 2;
    constexpr int32_t CleartextPassword = 3;
    constexpr int32_t MD5Password = 5;
    constexpr int32_t SCMCredential = 6;
    constexpr int32_t GSS = 7;
    constexpr int32_t GSSContinue = 8;
    constexpr int32_t SSPI = 9;
    constexpr int32_t SASL = 10;
    constexpr int32_t SASLContinue = 11;
    constexpr int32_t SASLFinal = 12;
}

//===----------------------------------------------------------------------===//
// Transaction Status (ReadyForQuery status byte)
//===----------------------------------------------------------------------===//
namespace TransactionStatus {
    constexpr char Idle = 'I';
    constexpr char InTransaction = 'T';
    constexpr char Failed = 'E';
}

//===----------------------------------------------------------------------===//
// Error/Notice Field Types
//===----------------------------------------------------------------------===//
namespace ErrorField {
    constexpr char Severity = 'S';
    constexpr char SeverityNonLocalized = 'V';
    constexpr char Code = 'C';
    constexpr char Message = 'M';
    constexpr char Detail = 'D';
    constexpr char Hint = 'H';
    constexpr char Position = 'P';
    constexpr char Where = 'W';
    constexpr char Routine = 'R';
}

//===----------------------------------------------------------------------===//
// SQLSTATE codes emitted by the proxy
//===----------------------------------------------------------------------===//
namespace SqlState {
    constexpr const char* ConnectionException = "08000";
    constexpr const char* UnableToEstablishConnection = "08001";
    constexpr const char* ConnectionFailure = "08006";
    constexpr const char* ProtocolViolation = "08P01";
    constexpr const char* FeatureNotSupported = "0A000";
    constexpr const char* InvalidAuthorization = "28000";
    constexpr const char* TooManyConnections = "53300";
    constexpr const char* QueryCanceled = "57014";
    constexpr const char* AdminShutdown = "57P01";
    constexpr const char* CannotConnectNow = "57P03";
    constexpr const char* InternalError = "XX000";
}

//===----------------------------------------------------------------------===//
// Byte Order Utilities
//===----------------------------------------------------------------------===//
inline int16_t NetworkToHost16(int16_t value) {
    return static_cast<int16_t>(ntohs(static_cast<uint16_t>(value)));
}

inline int32_t NetworkToHost32(int32_t value) {
    return static_cast<int32_t>(ntohl(static_cast<uint32_t>(value)));
}

inline int16_t HostToNetwork16(int16_t value) {
    return static_cast<int16_t>(htons(static_cast<uint16_t>(value)));
}

inline int32_t HostToNetwork32(int32_t value) {
    return static_cast<int32_t>(htonl(static_cast<uint32_t>(value)));
}

} // namespace pg
} // namespace pgmux
