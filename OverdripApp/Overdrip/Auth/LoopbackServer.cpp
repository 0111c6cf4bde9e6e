#include "LoopbackServer.h"
#include "Core/Log.h"
#include <httplib.h>
#include <stdexcept>
#include <sys/socket.h>

namespace od {

LoopbackServer::LoopbackServer(CallbackEndpoint endpoint)
    : m_Endpoint(std::move(endpoint)) {
}

LoopbackServer::~LoopbackServer() {
    Stop();
}

bool LoopbackServer::Start(AuthError* err) {
    if (m_Thread.joinable()) return true;

    m_Server = std::make_unique<httplib::Server>();
    m_Server->set_keep_alive_max_count(1);
    // Solo SO_REUSEADDR: con SO_REUSEPORT otro proceso podría compartir el puerto
    m_Server->set_socket_options([](int sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    });
    m_Server->Get(m_Endpoint.path, [this](const httplib::Request& req, httplib::Response& res) {
        HandleCallback(req, res);
    });

    if (!m_Server->bind_to_port(m_Endpoint.host, m_Endpoint.port)) {
        SetError(err, AuthErrorKind::ListenerBind,
            "could not bind " + m_Endpoint.host + ":" + std::to_string(m_Endpoint.port) +
            " (is another login or process using the port?)");
        m_Server.reset();
        return false;
    }

    m_Thread = std::thread([this]() {
        try {
            // listen_after_bind devuelve false si accept falla sin que nadie haya pedido stop
            if (!m_Server->listen_after_bind() && !m_StopRequested) {
                std::lock_guard<std::mutex> lock(m_Mutex);
                m_Fault = std::make_exception_ptr(std::runtime_error("accept loop on the callback socket failed"));
            }
        }
        catch (...) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Fault = std::current_exception();
        }
        // Si nadie entregó un code, el que espera se despierta con el canal cerrado
        CloseChannel();
    });

    // Esperar a que el hilo esté aceptando, así Stop() nunca llega antes que listen
    m_Server->wait_until_ready();
    Log::Debug("callback listener ready on " + RedirectUri());
    return true;
}

void LoopbackServer::Stop() {
    m_StopRequested = true;
    if (m_Server) m_Server->stop();
    if (m_Thread.joinable() && m_Thread.get_id() != std::this_thread::get_id())
        m_Thread.join();
}

std::optional<std::string> LoopbackServer::WaitForCode(std::chrono::milliseconds timeout, AuthError* err) {
    if (!m_CodeFut.valid()) {
        SetError(err, AuthErrorKind::CallbackChannelClosed, "authorization code was already consumed");
        return std::nullopt;
    }
    if (!m_Server) {
        SetError(err, AuthErrorKind::CallbackChannelClosed, "callback listener was never started");
        return std::nullopt;
    }

    if (timeout.count() > 0 &&
        m_CodeFut.wait_for(timeout) != std::future_status::ready) {
        // Stop() espera las respuestas en curso: una de ellas puede entregar el code
        Stop();
        bool delivered = false;
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            delivered = m_Delivered;
        }
        if (!delivered) {
            SetError(err, AuthErrorKind::CallbackTimeout,
                "no authorization code received within " +
                std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout).count()) + "s");
            return std::nullopt;
        }
        Log::Debug("authorization code arrived while the listener was shutting down");
    }

    std::string code;
    try {
        code = m_CodeFut.get();
    }
    catch (const std::future_error&) {
        Stop();
        std::exception_ptr fault;
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            fault = m_Fault;
        }
        if (!fault) {
            SetError(err, AuthErrorKind::CallbackChannelClosed,
                "callback listener stopped before an authorization code arrived");
            return std::nullopt;
        }
        try {
            std::rethrow_exception(fault);
        }
        catch (const std::exception& e) {
            SetError(err, AuthErrorKind::ListenerTaskFailed, "callback listener terminated abnormally", e.what());
        }
        catch (...) {
            SetError(err, AuthErrorKind::ListenerTaskFailed, "callback listener terminated abnormally",
                "non-standard exception");
        }
        return std::nullopt;
    }

    // Recién ahora (code entregado) se pide el apagado, y se espera a que termine
    Stop();
    return code;
}

void LoopbackServer::HandleCallback(const httplib::Request& req, httplib::Response& res) {
    res.status = 200;

    if (!req.has_param("code") || req.get_param_value("code").empty()) {
        std::string reason = req.has_param("error") ? req.get_param_value("error") : "no code parameter";
        Log::Warn("callback without authorization code: " + reason);
        res.set_content(kFailurePage, "text/html");
        return;
    }

    if (Deliver(req.get_param_value("code"))) {
        res.set_content(kSuccessPage, "text/html");
    }
    else {
        Log::Warn("failed to hand off authorization code: session already completed");
        res.set_content(kFailurePage, "text/html");
    }
}

bool LoopbackServer::Deliver(const std::string& code) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Settled) return false;
    m_Code.set_value(code);
    m_Settled = true;
    m_Delivered = true;
    return true;
}

void LoopbackServer::CloseChannel() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Settled) return;
    m_Settled = true;
    m_Code.set_exception(std::make_exception_ptr(std::future_error(std::future_errc::broken_promise)));
}

}
