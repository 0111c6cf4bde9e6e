#include <gtest/gtest.h>
#include "Auth/LoopbackServer.h"
#include "Core/Log.h"
#include <httplib.h>
#include <future>
#include <string_view>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace od;
using namespace std::chrono_literals;

namespace {

CallbackEndpoint TestEndpoint(int port) {
    return CallbackEndpoint{ .host = "127.0.0.1", .port = port, .path = "/callback" };
}

std::future<httplib::Result> GetAsync(int port, std::string target) {
    return std::async(std::launch::async, [port, target = std::move(target)]() {
        httplib::Client cli("127.0.0.1", port);
        cli.set_connection_timeout(5);
        return cli.Get(target);
    });
}

// Socket de escucha (propiedad del servidor) ligado a `port`, o -1
int FindListeningSocket(int port) {
    for (int fd = 0; fd < 1024; ++fd) {
        int accepting = 0;
        socklen_t len = sizeof(accepting);
        if (::getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &accepting, &len) != 0 || !accepting) continue;
        sockaddr_in addr{};
        socklen_t alen = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &alen) != 0 || addr.sin_family != AF_INET) continue;
        if (ntohs(addr.sin_port) == port) return fd;
    }
    return -1;
}

int ConnectRaw(int port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool SendAll(int fd, std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n <= 0) return false;
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

struct QuietLog : ::testing::Test {
    void SetUp() override { m_Prev = Log::SetSink(&m_Null); }
    void TearDown() override { Log::SetSink(m_Prev); }
    NullLogSink m_Null;
    ILogSink* m_Prev = nullptr;
};

}

using LoopbackServerTest = QuietLog;

TEST_F(LoopbackServerTest, DeliversCodeAndReleasesPort) {
    const int port = 47311;
    LoopbackServer server(TestEndpoint(port));
    AuthError err;
    ASSERT_TRUE(server.Start(&err)) << err.Describe();

    auto browser = GetAsync(port, "/callback?code=ABC123");
    auto code = server.WaitForCode(10s, &err);
    ASSERT_TRUE(code.has_value()) << err.Describe();
    EXPECT_EQ(*code, "ABC123");

    auto res = browser.get();
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("Authentication successful!"), std::string::npos);

    // El puerto quedó libre
    LoopbackServer again(TestEndpoint(port));
    EXPECT_TRUE(again.Start(&err)) << err.Describe();
    again.Stop();
}

TEST_F(LoopbackServerTest, DecodesPercentEncodedCode) {
    const int port = 47312;
    LoopbackServer server(TestEndpoint(port));
    ASSERT_TRUE(server.Start());

    auto browser = GetAsync(port, "/callback?code=4%2F0AX4XfWh&scope=email");
    auto code = server.WaitForCode(10s);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, "4/0AX4XfWh");
    browser.get();
}

TEST_F(LoopbackServerTest, StoppedBeforeCallbackClosesChannel) {
    LoopbackServer server(TestEndpoint(47313));
    ASSERT_TRUE(server.Start());
    server.Stop();

    AuthError err;
    auto code = server.WaitForCode(10s, &err);
    EXPECT_FALSE(code.has_value());
    EXPECT_EQ(err.kind, AuthErrorKind::CallbackChannelClosed);
}

TEST_F(LoopbackServerTest, WaitWithoutStartFails) {
    LoopbackServer server(TestEndpoint(47314));
    AuthError err;
    EXPECT_FALSE(server.WaitForCode(1s, &err).has_value());
    EXPECT_EQ(err.kind, AuthErrorKind::CallbackChannelClosed);
}

TEST_F(LoopbackServerTest, PortInUseFailsFast) {
    const int port = 47315;
    LoopbackServer first(TestEndpoint(port));
    ASSERT_TRUE(first.Start());

    LoopbackServer second(TestEndpoint(port));
    AuthError err;
    EXPECT_FALSE(second.Start(&err));
    EXPECT_EQ(err.kind, AuthErrorKind::ListenerBind);
    first.Stop();
}

TEST_F(LoopbackServerTest, TimesOutWithoutCallback) {
    LoopbackServer server(TestEndpoint(47316));
    ASSERT_TRUE(server.Start());

    AuthError err;
    EXPECT_FALSE(server.WaitForCode(200ms, &err).has_value());
    EXPECT_EQ(err.kind, AuthErrorKind::CallbackTimeout);
}

TEST_F(LoopbackServerTest, CallbackWithoutCodeKeepsListening) {
    const int port = 47317;
    LoopbackServer server(TestEndpoint(port));
    ASSERT_TRUE(server.Start());

    // El usuario rechazó el consentimiento: página de error, pero el listener sigue
    auto denied = GetAsync(port, "/callback?error=access_denied").get();
    ASSERT_TRUE(denied);
    EXPECT_EQ(denied->status, 200);
    EXPECT_NE(denied->body.find("Authentication failed"), std::string::npos);

    auto ok = GetAsync(port, "/callback?code=second-try");
    auto code = server.WaitForCode(10s);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, "second-try");
    ok.get();
}

TEST_F(LoopbackServerTest, OnlyFirstCodeIsAccepted) {
    const int port = 47318;
    LoopbackServer server(TestEndpoint(port));
    ASSERT_TRUE(server.Start());

    auto first = GetAsync(port, "/callback?code=first").get();
    auto second = GetAsync(port, "/callback?code=second").get();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first->body.find("Authentication successful!"), std::string::npos);
    EXPECT_NE(second->body.find("Authentication failed"), std::string::npos);

    auto code = server.WaitForCode(10s);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, "first");
}

TEST_F(LoopbackServerTest, CodeArrivingDuringTimeoutShutdownWins) {
    const int port = 47319;
    LoopbackServer server(TestEndpoint(port));
    ASSERT_TRUE(server.Start());

    // Petición a medias: el worker queda leyendo cabeceras cuando vence el timeout
    const int fd = ConnectRaw(port);
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(SendAll(fd, "GET /callback?code=late HTTP/1.1\r\n"));

    auto browser = std::async(std::launch::async, [fd]() {
        std::this_thread::sleep_for(600ms);
        std::string response;
        if (SendAll(fd, "Host: 127.0.0.1\r\nConnection: close\r\n\r\n")) {
            char buf[1024];
            ssize_t n = 0;
            while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) response.append(buf, static_cast<size_t>(n));
        }
        ::close(fd);
        return response;
    });

    AuthError err;
    auto code = server.WaitForCode(200ms, &err);
    ASSERT_TRUE(code.has_value()) << err.Describe();
    EXPECT_EQ(*code, "late");
    EXPECT_NE(browser.get().find("Authentication successful!"), std::string::npos);
}

TEST_F(LoopbackServerTest, AcceptFailureIsReportedAsListenerFault) {
    const int port = 47320;
    LoopbackServer server(TestEndpoint(port));
    ASSERT_TRUE(server.Start());

    // Romper el socket de escucha sin pasar por Stop(): accept falla dentro del hilo
    const int fd = FindListeningSocket(port);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::shutdown(fd, SHUT_RDWR), 0);

    AuthError err;
    EXPECT_FALSE(server.WaitForCode(10s, &err).has_value());
    EXPECT_EQ(err.kind, AuthErrorKind::ListenerTaskFailed);
    EXPECT_NE(err.detail.find("accept"), std::string::npos);
}

TEST_F(LoopbackServerTest, StopIsNotAListenerFault) {
    LoopbackServer server(TestEndpoint(47321));
    ASSERT_TRUE(server.Start());
    server.Stop();

    AuthError err;
    EXPECT_FALSE(server.WaitForCode(1s, &err).has_value());
    EXPECT_NE(err.kind, AuthErrorKind::ListenerTaskFailed);
}

TEST(CallbackEndpoint, DefaultRedirectUri) {
    EXPECT_EQ(CallbackEndpoint{}.RedirectUri(), "http://localhost:8080/callback");
}
