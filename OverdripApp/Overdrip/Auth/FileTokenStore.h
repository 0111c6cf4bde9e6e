#pragma once
#include <filesystem>
#include "TokenStore.h"

namespace od {

// JSON en disco con permisos 0600 (rw-------).
class FileTokenStore : public TokenStore {
public:
    explicit FileTokenStore(std::filesystem::path path) : m_Path(std::move(path)) {}

    bool Save(const TokenSet& tokens, std::string* err = nullptr) override;
    bool Load(std::optional<TokenSet>& out, std::string* err = nullptr) const override;
    bool Clear(std::string* err = nullptr) override;

    const std::filesystem::path& Path() const { return m_Path; }

private:
    std::filesystem::path m_Path;
};

}
