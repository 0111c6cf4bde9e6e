#include "Application.h"
#include "Core/Log.h"
#include "Auth/FileTokenStore.h"
#include "Auth/LoginFlow.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace od {

    void Application::Run(std::ostream& out) const {
        Log::Debug("monitor interval=" + std::to_string(m_Config.monitor.interval) +
            "s threshold=" + std::to_string(m_Config.monitor.threshold));
        out << "Overdrip is running!" << std::endl;
    }

    bool Application::Login(std::string* err) {
        if (!m_Creds.Complete()) {
            if (err) *err = "OAuth client credentials are not configured "
                "(set OVERDRIP_OAUTH_CLIENT_ID and OVERDRIP_OAUTH_CLIENT_SECRET)";
            return false;
        }

        FileTokenStore store(m_Config.TokenPath());
        LoginFlow flow(m_Creds, OAuthConfig{}, store);
        flow.SetCallbackTimeout(std::chrono::seconds(m_Config.auth.callback_timeout_sec));
        if (m_Config.auth.open_browser) {
            flow.SetPresenter([](const std::string& url) {
                std::cout << "Login at: " << url << std::endl;
                if (!OpenInBrowser(url)) Log::Warn("could not open a browser, open the URL above manually");
            });
        }

        AuthError aerr;
        if (!flow.Login(&aerr)) {
            if (!aerr.detail.empty()) Log::Debug("login failure detail: " + aerr.detail);
            if (err) *err = "login failed: " + aerr.Describe();
            return false;
        }
        Log::Info("tokens stored at " + store.Path().string());
        return true;
    }

    bool Application::Logout(std::string* err) {
        FileTokenStore store(m_Config.TokenPath());
        std::string why;
        if (!store.Clear(&why)) {
            if (err) *err = "logout failed: " + why;
            return false;
        }
        Log::Info("stored credentials removed");
        return true;
    }

    void Application::ShowConfig(std::ostream& out) const {
        out << ConfigSerializer::Dump(m_Config) << std::endl;
    }

    bool Application::EditConfig(std::string* err) const {
        std::error_code ec;
        if (!std::filesystem::exists(m_ConfigPath, ec)) {
            // Dejar un archivo con los valores por defecto para que el editor tenga algo
            if (!ConfigSerializer::Save(m_Config, m_ConfigPath, err)) return false;
        }

        std::string editor;
        if (const char* e = std::getenv("EDITOR"); e && *e) editor = e;
        else if (const char* v = std::getenv("VISUAL"); v && *v) editor = v;
        else {
            Log::Warn("unable to determine editor, defaulting to 'nano'");
            editor = "nano";
        }

        return LaunchEditor(editor, m_ConfigPath, err);
    }

    bool LaunchEditor(const std::string& editor, const std::filesystem::path& file, std::string* err) {
        const std::string arg = file.string();
        char* argv[] = { const_cast<char*>(editor.c_str()), const_cast<char*>(arg.c_str()), nullptr };

        pid_t pid = 0;
        const int rc = ::posix_spawnp(&pid, editor.c_str(), nullptr, nullptr, argv, environ);
        if (rc != 0) {
            if (err) *err = "failed to open editor '" + editor + "': " + std::strerror(rc);
            return false;
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                if (err) *err = "failed to wait for editor '" + editor + "': " + std::strerror(errno);
                return false;
            }
        }
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0)
            Log::Warn("editor '" + editor + "' exited with status " + std::to_string(WEXITSTATUS(status)));
        else if (WIFSIGNALED(status))
            Log::Warn("editor '" + editor + "' terminated by signal " + std::to_string(WTERMSIG(status)));
        return true;
    }

}
