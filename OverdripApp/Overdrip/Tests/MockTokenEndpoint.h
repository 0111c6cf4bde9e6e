#pragma once
#include <httplib.h>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// Token endpoint falso en 127.0.0.1 con puerto efímero. Guarda el último form recibido.
class MockTokenEndpoint {
public:
    MockTokenEndpoint(int status, std::string body) : m_Status(status), m_Body(std::move(body)) {
        m_Server.Post("/token", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(m_Mutex);
                m_Form.clear();
                for (const auto& [k, v] : req.params) m_Form[k] = v;
                ++m_Hits;
            }
            res.status = m_Status;
            res.set_content(m_Body, "application/json");
        });
        m_Port = m_Server.bind_to_any_port("127.0.0.1");
        m_Thread = std::thread([this]() { m_Server.listen_after_bind(); });
        m_Server.wait_until_ready();
    }

    ~MockTokenEndpoint() {
        m_Server.stop();
        if (m_Thread.joinable()) m_Thread.join();
    }

    std::string Url() const { return "http://127.0.0.1:" + std::to_string(m_Port) + "/token"; }

    std::string Field(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Form.find(key);
        return it == m_Form.end() ? std::string() : it->second;
    }

    int Hits() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Hits;
    }

private:
    httplib::Server m_Server;
    std::thread m_Thread;
    int m_Port = 0;
    int m_Status;
    std::string m_Body;

    mutable std::mutex m_Mutex;
    std::map<std::string, std::string> m_Form;
    int m_Hits = 0;
};
