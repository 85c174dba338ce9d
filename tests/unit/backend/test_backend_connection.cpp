//===----------------------------------------------------------------------===//
//                         PgMux Server - Unit Tests
//
// tests/unit/backend/test_backend_connection.cpp
//
// Unit tests for BackendConnection over an in-memory transport
//===----------------------------------------------------------------------===//

#include "backend/backend_connection.hpp"
#include "protocol/pg/pg_auth.hpp"
#include "support/fake_transport.hpp"
#include <cassert>
#include <iostream>

using namespace pgmux;
using namespace pgmux::pg;
using namespace pgmux::test;

static const std::chrono::milliseconds TIMEOUT(1000);

struct TestConnection {
    FakeTransport* transport;
    std::unique_ptr<BackendConnection> conn;
};

TestConnection MakeConnection(uint64_t id = 1) {
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* raw = transport.get();
    auto conn = std::make_unique<BackendConnection>(id, ConnectionKey("alice", "shop"),
                                                    std::move(transport));
    return TestConnection{raw, std::move(conn)};
}

std::vector<uint8_t> AuthRequest(int32_t type, const std::vector<uint8_t>& extra = {}) {
    PgMessageWriter writer;
    writer.WriteAuthenticationRequest(type, extra);
    return writer.TakeBuffer();
}

// Frames the connection wrote after the untagged startup packet
std::vector<Frame> WrittenFrames(const FakeTransport& transport, bool skip_startup) {
    std::vector<uint8_t> bytes = transport.Written();
    FrameDecoder decoder;
    decoder.Feed(bytes.data(), bytes.size());
    std::vector<Frame> frames;
    if (skip_startup) {
        DecodeResult startup = decoder.Next(true);
        assert(startup.Ok());
    }
    while (true) {
        DecodeResult result = decoder.Next();
        if (!result.Ok()) {
            break;
        }
        frames.push_back(std::move(result.frame));
    }
    return frames;
}

bool HandshakeThrows(TestConnection& tc, const std::string& password, std::string& message) {
    try {
        tc.conn->Handshake(password, TIMEOUT);
    } catch (const PoolError& e) {
        assert(e.Kind() == ErrorKind::HandshakeFailed);
        message = e.what();
        return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Handshake
//===----------------------------------------------------------------------===//

void TestTrustHandshake() {
    std::cout << "  Testing trust handshake..." << std::endl;

    TestConnection tc = MakeConnection();
    assert(tc.conn->GetState() == ConnectionState::Connecting);

    tc.transport->Inject(StartupReply(4242, 99));
    tc.conn->Handshake("", TIMEOUT);

    assert(tc.conn->GetState() == ConnectionState::Idle);
    assert(tc.conn->BackendPid() == 4242);
    assert(tc.conn->CancelSecret() == 99);
    assert(tc.conn->GetParameters().at("server_version") == "16.2");
    assert(tc.conn->GetParameters().at("client_encoding") == "UTF8");
    assert(!tc.conn->InTransaction());
    assert(tc.conn->IsReusable());

    // Startup packet carries user and database
    std::vector<uint8_t> written = tc.transport->Written();
    DecodeResult startup = DecodeStartupFrame(written.data(), written.size());
    assert(startup.Ok());
    PgMessageReader reader(startup.frame.payload);
    StartupMessage msg;
    assert(reader.ReadStartupMessage(msg));
    assert(msg.GetUser() == "alice");
    assert(msg.GetDatabase() == "shop");

    std::cout << "    PASSED" << std::endl;
}

void TestCleartextHandshake() {
    std::cout << "  Testing cleartext password handshake..." << std::endl;

    TestConnection tc = MakeConnection();
    tc.transport->Inject(AuthRequest(AuthType::CleartextPassword));
    tc.transport->Inject(StartupReply(1, 2));
    tc.conn->Handshake("secret", TIMEOUT);
    assert(tc.conn->GetState() == ConnectionState::Idle);

    std::vector<Frame> frames = WrittenFrames(*tc.transport, true);
    assert(frames.size() == 1);
    assert(frames[0].tag == FrontendMessage::PasswordMessage);
    std::string password(reinterpret_cast<const char*>(frames[0].payload.data()));
    assert(password == "secret");

    std::cout << "    PASSED" << std::endl;
}

void TestMD5Handshake() {
    std::cout << "  Testing MD5 password handshake..." << std::endl;

    const std::vector<uint8_t> salt = {0x11, 0x22, 0x33, 0x44};
    TestConnection tc = MakeConnection();
    tc.transport->Inject(AuthRequest(AuthType::MD5Password, salt));
    tc.transport->Inject(StartupReply(1, 2));
    tc.conn->Handshake("secret", TIMEOUT);

    std::vector<Frame> frames = WrittenFrames(*tc.transport, true);
    assert(frames.size() == 1);
    std::string sent(reinterpret_cast<const char*>(frames[0].payload.data()));
    assert(sent == ComputeMD5Password("alice", "secret", salt.data()));

    std::cout << "    PASSED" << std::endl;
}

void TestMissingPassword() {
    std::cout << "  Testing password request without configured password..." << std::endl;

    TestConnection tc = MakeConnection();
    tc.transport->Inject(AuthRequest(AuthType::CleartextPassword));
    std::string message;
    assert(HandshakeThrows(tc, "", message));
    assert(message.find("alice") != std::string::npos);
    assert(tc.conn->GetState() == ConnectionState::Failed);
    assert(tc.conn->LastError() == ErrorKind::HandshakeFailed);
    assert(!tc.conn->IsOpen());
    assert(!tc.conn->IsReusable());

    std::cout << "    PASSED" << std::endl;
}

void TestServerRejectsStartup() {
    std::cout << "  Testing ErrorResponse during startup..." << std::endl;

    TestConnection tc = MakeConnection();
    tc.transport->Inject(ErrorReply("FATAL", "28P01", "password authentication failed", false));
    std::string message;
    assert(HandshakeThrows(tc, "wrong", message));
    assert(message.find("28P01") != std::string::npos);
    assert(tc.conn->LastErrorMessage() == message);

    std::cout << "    PASSED" << std::endl;
}

void TestUnsupportedAuthentication() {
    std::cout << "  Testing unsupported authentication methods..." << std::endl;

    {
        TestConnection tc = MakeConnection();
        tc.transport->Inject(AuthRequest(AuthType::KerberosV5));
        std::string message;
        assert(HandshakeThrows(tc, "secret", message));
        assert(message.find("unsupported") != std::string::npos);
    }
    {
        // SASL without SCRAM-SHA-256 in the mechanism list
        std::vector<uint8_t> mechanisms = {'S', 'C', 'R', 'A', 'M', '-', 'S', 'H', 'A', '-', '1', 0, 0};
        TestConnection tc = MakeConnection();
        tc.transport->Inject(AuthRequest(AuthType::SASL, mechanisms));
        std::string message;
        assert(HandshakeThrows(tc, "secret", message));
        assert(message.find("SASL") != std::string::npos);
    }

    std::cout << "    PASSED" << std::endl;
}

void TestHandshakeTimeout() {
    std::cout << "  Testing silent backend during startup..." << std::endl;

    TestConnection tc = MakeConnection();
    std::string message;
    assert(HandshakeThrows(tc, "", message));
    assert(tc.conn->GetState() == ConnectionState::Failed);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Housekeeping Queries
//===----------------------------------------------------------------------===//

TestConnection ReadyConnection() {
    TestConnection tc = MakeConnection();
    tc.transport->Inject(StartupReply(10, 20));
    tc.conn->Handshake("", TIMEOUT);
    tc.transport->SetResponder(SimpleQueryResponder());
    tc.transport->ClearWritten();
    return tc;
}

void TestExecuteSimple() {
    std::cout << "  Testing ExecuteSimple..." << std::endl;

    TestConnection tc = ReadyConnection();
    std::string error;
    assert(tc.conn->ExecuteSimple("SET search_path = public", TIMEOUT, error));
    assert(error.empty());
    assert(tc.conn->ProtocolState().AtBoundary());

    std::vector<Frame> frames = WrittenFrames(*tc.transport, false);
    assert(frames.size() == 1 && frames[0].tag == FrontendMessage::Query);

    std::cout << "    PASSED" << std::endl;
}

void TestExecuteSimpleError() {
    std::cout << "  Testing ExecuteSimple with ErrorResponse..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->SetResponder([](FakeTransport& t, const std::vector<uint8_t>&) {
        t.Inject(ErrorReply("ERROR", "42601", "syntax error"));
    });

    std::string error;
    assert(!tc.conn->ExecuteSimple("SELEC 1", TIMEOUT, error));
    assert(error == "ERROR 42601: syntax error");
    // A plain ERROR leaves the session usable
    assert(tc.conn->IsReusable());

    std::cout << "    PASSED" << std::endl;
}

void TestRollback() {
    std::cout << "  Testing Rollback..." << std::endl;

    TestConnection tc = ReadyConnection();
    std::string error;
    assert(tc.conn->ExecuteSimple("BEGIN", TIMEOUT, error));
    assert(tc.conn->InTransaction());
    assert(tc.conn->GetTransactionStatus() == TransactionStatus::InTransaction);

    assert(tc.conn->Rollback(TIMEOUT));
    assert(!tc.conn->InTransaction());
    assert(tc.conn->Ping(TIMEOUT));

    std::cout << "    PASSED" << std::endl;
}

void TestSilentBackendBreaksConnection() {
    std::cout << "  Testing query timeout..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->SetResponder(nullptr);
    assert(!tc.conn->Ping(TIMEOUT));
    assert(tc.conn->GetState() == ConnectionState::Broken);
    assert(tc.conn->LastError() == ErrorKind::BackendUnavailable);
    assert(!tc.conn->IsReusable());

    std::cout << "    PASSED" << std::endl;
}

void TestWriteFailure() {
    std::cout << "  Testing write failure..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->FailWrites(true);
    std::string error;
    assert(!tc.conn->ExecuteSimple("SELECT 1", TIMEOUT, error));
    assert(error.find("write to backend failed") != std::string::npos);
    assert(tc.conn->GetState() == ConnectionState::Broken);

    std::cout << "    PASSED" << std::endl;
}

void TestTerminate() {
    std::cout << "  Testing Terminate..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.conn->Terminate();
    assert(!tc.conn->IsOpen());
    assert(tc.conn->GetState() == ConnectionState::Closed);

    std::vector<Frame> frames = WrittenFrames(*tc.transport, false);
    assert(frames.size() == 1 && frames[0].tag == FrontendMessage::Terminate);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Relay I/O
//===----------------------------------------------------------------------===//

void TestRelayRoundTrip() {
    std::cout << "  Testing relay send and receive..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->SetResponder(nullptr);
    tc.conn->MarkLeased();
    assert(tc.conn->UseCount() == 1);

    bool sent = false;
    std::vector<Frame> out = {Frame(FrontendMessage::Query, {'S', 'E', 'L', 'E', 'C', 'T', ' ', '1', 0})};
    tc.conn->AsyncSendFrames(out, [&sent](const std::error_code& ec) {
        assert(!ec);
        sent = true;
    });
    assert(sent);
    assert(!tc.conn->ProtocolState().AtBoundary());
    assert(!tc.conn->IsReusable());

    size_t received = 0;
    tc.conn->AsyncRead([&received](const std::error_code& ec, size_t n) {
        assert(!ec);
        received = n;
    });
    assert(tc.transport->HasPendingRead());

    tc.transport->Inject(QueryReply("SELECT 1"));
    assert(received > 0);

    std::vector<Frame> frames;
    std::string error;
    assert(tc.conn->ConsumeReceived(received, frames, error) == ErrorKind::None);
    assert(frames.size() == 2);
    assert(frames[0].tag == BackendMessage::CommandComplete);
    assert(frames[1].tag == BackendMessage::ReadyForQuery);
    assert(tc.conn->ProtocolState().AtBoundary());
    assert(tc.conn->IsReusable());

    std::cout << "    PASSED" << std::endl;
}

void TestRelayPartialFrame() {
    std::cout << "  Testing partial backend frame..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->SetResponder(nullptr);

    std::vector<uint8_t> reply = QueryReply("SELECT 1");
    std::vector<uint8_t> head(reply.begin(), reply.begin() + 3);

    size_t received = 0;
    tc.conn->AsyncRead([&received](const std::error_code&, size_t n) { received = n; });
    tc.transport->Inject(head);

    std::vector<Frame> frames;
    std::string error;
    assert(tc.conn->ConsumeReceived(received, frames, error) == ErrorKind::None);
    assert(frames.empty());
    assert(!tc.conn->IsReusable());

    std::cout << "    PASSED" << std::endl;
}

void TestRelayMalformedFrame() {
    std::cout << "  Testing malformed backend frame..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->SetResponder(nullptr);
    tc.conn->MarkLeased();

    size_t received = 0;
    tc.conn->AsyncRead([&received](const std::error_code&, size_t n) { received = n; });
    // Length field below the minimum of 4
    tc.transport->Inject({'Z', 0, 0, 0, 1});

    std::vector<Frame> frames;
    std::string error;
    assert(tc.conn->ConsumeReceived(received, frames, error) == ErrorKind::MalformedFrame);
    assert(!error.empty());
    assert(tc.conn->GetState() == ConnectionState::Broken);
    assert(tc.conn->LastError() == ErrorKind::MalformedFrame);
    assert(!tc.conn->IsReusable());

    std::cout << "    PASSED" << std::endl;
}

void TestCancelIo() {
    std::cout << "  Testing CancelIo..." << std::endl;

    TestConnection tc = ReadyConnection();
    std::error_code result;
    tc.conn->AsyncRead([&result](const std::error_code& ec, size_t) { result = ec; });
    tc.conn->CancelIo();
    assert(result == asio::error::operation_aborted);
    assert(tc.transport->CancelCount() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestParameterStatusWhileRelaying() {
    std::cout << "  Testing ParameterStatus tracking while relaying..." << std::endl;

    TestConnection tc = ReadyConnection();
    tc.transport->SetResponder(nullptr);

    PgMessageWriter writer;
    writer.WriteParameterStatus("TimeZone", "UTC");
    size_t received = 0;
    tc.conn->AsyncRead([&received](const std::error_code&, size_t n) { received = n; });
    tc.transport->Inject(writer.TakeBuffer());

    std::vector<Frame> frames;
    std::string error;
    assert(tc.conn->ConsumeReceived(received, frames, error) == ErrorKind::None);
    assert(frames.size() == 1);
    assert(tc.conn->GetParameters().at("TimeZone") == "UTC");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Backend Connection Unit Tests ===" << std::endl;

    std::cout << "\n1. Handshake:" << std::endl;
    TestTrustHandshake();
    TestCleartextHandshake();
    TestMD5Handshake();
    TestMissingPassword();
    TestServerRejectsStartup();
    TestUnsupportedAuthentication();
    TestHandshakeTimeout();

    std::cout << "\n2. Housekeeping Queries:" << std::endl;
    TestExecuteSimple();
    TestExecuteSimpleError();
    TestRollback();
    TestSilentBackendBreaksConnection();
    TestWriteFailure();
    TestTerminate();

    std::cout << "\n3. Relay I/O:" << std::endl;
    TestRelayRoundTrip();
    TestRelayPartialFrame();
    TestRelayMalformedFrame();
    TestCancelIo();
    TestParameterStatusWhileRelaying();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
