#include "FileTokenStore.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using json = nlohmann::json;

namespace od {

static std::string errno_text() {
    return std::strerror(errno);
}

static bool write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool FileTokenStore::Save(const TokenSet& tokens, std::string* err) {
    // Lo que no se podría volver a cargar no se escribe (ni se pisa el archivo anterior)
    std::string why;
    if (!ValidateTokenSet(tokens, &why)) {
        if (err) *err = "refusing to save invalid tokens: " + why;
        return false;
    }

    std::error_code ec;
    if (m_Path.has_parent_path()) {
        std::filesystem::create_directories(m_Path.parent_path(), ec);
        if (ec) {
            if (err) *err = "failed to create directory " + m_Path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    const std::string data = TokenSetToJson(tokens).dump(2);

    // O_TRUNC: se sobrescribe entero; 0600 desde el open, sin ventana con permisos abiertos
    const int fd = ::open(m_Path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        if (err) *err = "failed to open " + m_Path.string() + " for writing: " + errno_text();
        return false;
    }
    // Si el archivo ya existía con otros permisos, el modo del open no aplica
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        if (err) *err = "failed to restrict permissions on " + m_Path.string() + ": " + errno_text();
        ::close(fd);
        return false;
    }
    if (!write_all(fd, data)) {
        if (err) *err = "failed to write " + m_Path.string() + ": " + errno_text();
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        if (err) *err = "failed to close " + m_Path.string() + ": " + errno_text();
        return false;
    }
    return true;
}

bool FileTokenStore::Load(std::optional<TokenSet>& out, std::string* err) const {
    out.reset();
    std::error_code ec;
    if (!std::filesystem::exists(m_Path, ec)) {
        if (ec) {
            if (err) *err = "failed to stat " + m_Path.string() + ": " + ec.message();
            return false;
        }
        return true;
    }

    std::ifstream ifs(m_Path);
    if (!ifs) {
        if (err) *err = "failed to read auth tokens from " + m_Path.string();
        return false;
    }

    json j;
    try { ifs >> j; }
    catch (const json::parse_error& e) {
        if (err) *err = "failed to parse auth tokens from " + m_Path.string() + ": " + e.what();
        return false;
    }

    std::string why;
    auto tokens = TokenSetFromJson(j, &why);
    if (!tokens) {
        if (err) *err = "invalid auth tokens in " + m_Path.string() + ": " + why;
        return false;
    }
    out = std::move(tokens);
    return true;
}

bool FileTokenStore::Clear(std::string* err) {
    std::error_code ec;
    std::filesystem::remove(m_Path, ec);   // false sin error si no existía
    if (ec) {
        if (err) *err = "failed to remove auth token file " + m_Path.string() + ": " + ec.message();
        return false;
    }
    return true;
}

}
