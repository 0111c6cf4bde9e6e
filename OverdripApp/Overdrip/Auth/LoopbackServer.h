#pragma once
#include <string>
#include <future>
#include <thread>
#include <mutex>
#include <memory>
#include <chrono>
#include <optional>
#include <exception>
#include <atomic>
#include "AuthError.h"

namespace httplib { class Server; struct Request; struct Response; }

namespace od {

struct CallbackEndpoint {
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/callback";

    // URI para registrar en el auth request y en el token request
    std::string RedirectUri() const { return "http://" + host + ":" + std::to_string(port) + path; }
};

// Servidor HTTP de un solo uso para recibir el redirect del proveedor.
// El primer `code` que llega se entrega a WaitForCode; los siguientes reciben la página de error.
class LoopbackServer {
public:
    static constexpr const char* kSuccessPage =
        "<h1>Authentication successful!</h1><p>You can now close this window.</p>";
    static constexpr const char* kFailurePage =
        "<h1>Authentication failed</h1><p>The authentication session may have timed out. Please try again.</p>";

    explicit LoopbackServer(CallbackEndpoint endpoint = {});
    ~LoopbackServer();

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    // Hace el bind en el hilo que llama (falla rápido con ListenerBind) y arranca el hilo de escucha.
    bool Start(AuthError* err = nullptr);

    // Bloquea hasta recibir el code. timeout == 0 => sin límite.
    // Al volver, el servidor ya está detenido y el puerto liberado.
    std::optional<std::string> WaitForCode(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
        AuthError* err = nullptr);

    // Señal de apagado + espera a que terminen las respuestas en curso.
    void Stop();

    const CallbackEndpoint& Endpoint() const { return m_Endpoint; }
    std::string RedirectUri() const { return m_Endpoint.RedirectUri(); }

private:
    void HandleCallback(const httplib::Request& req, httplib::Response& res);
    bool Deliver(const std::string& code);
    void CloseChannel();

    CallbackEndpoint m_Endpoint;
    std::unique_ptr<httplib::Server> m_Server;
    std::thread m_Thread;
    std::atomic<bool> m_StopRequested{false};

    std::mutex m_Mutex;
    bool m_Settled = false;   // slot usado (code entregado) o canal cerrado
    bool m_Delivered = false;
    std::promise<std::string> m_Code;
    std::future<std::string> m_CodeFut = m_Code.get_future();
    std::exception_ptr m_Fault;
};

}
