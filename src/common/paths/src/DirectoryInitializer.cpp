// src/common/paths/src/DirectoryInitializer.cpp
#include "common/paths/include/DirectoryInitializer.hpp"
#include "common/paths/include/PathResolver.hpp"
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"

namespace devsecrets::paths
{
    fs::path DirectoryInitializer::EnsureDirectory(const fs::path& path, bool* created)
    {
        std::error_code ec;

        // 이미 존재하면 false 반환 (오류 아님)
        const bool newly_created = fs::create_directories(path, ec);
        if (ec) {
            throw SecretsIoException("Failed to create secrets directory", path, ec);
        }

        fs::file_status st = fs::status(path, ec);
        if (ec) {
            throw SecretsIoException("Failed to stat secrets directory", path, ec);
        }
        if (!fs::is_directory(st)) {
            throw SecretsIoException("Secrets path exists but is not a directory", path,
                                     std::make_error_code(std::errc::not_a_directory));
        }

        if (newly_created) {
            fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
            if (ec) {
                throw SecretsIoException("Failed to restrict secrets directory permissions", path, ec);
            }
            DEVSECRETS_LOG_INFOF("DirectoryInitializer", "Created secrets directory: \"%s\"", path.c_str());
        } else {
            DEVSECRETS_LOG_DEBUGF("DirectoryInitializer", "Secrets directory already exists: \"%s\"", path.c_str());
        }

        if (created) {
            *created = newly_created;
        }
        return path;
    }

    InitResult DirectoryInitializer::Init(const fs::path& repo_root, const fs::path& base_root)
    {
        std::error_code ec;
        fs::file_status st = fs::status(repo_root, ec);
        if (ec || !fs::is_directory(st)) {
            throw SecretsIoException("Repository root is not a directory", repo_root,
                                     ec ? ec : std::make_error_code(std::errc::not_a_directory));
        }

        const fs::path id_file = repo_root / identifier::IDENTIFIER_FILE_NAME;
        identifier::EnsuredIdentifier ensured = identifier::IdentifierStore::Ensure(id_file);

        const fs::path secrets_dir = PathResolver::Resolve(base_root, ensured.id);

        bool dir_created = false;
        EnsureDirectory(secrets_dir, &dir_created);

        DEVSECRETS_LOG_INFOF("DirectoryInitializer", "Repository %s bound to %s",
                             repo_root.c_str(), secrets_dir.c_str());

        return InitResult{ ensured.id, id_file, secrets_dir, ensured.created, dir_created };
    }

    InitResult DirectoryInitializer::Init(const fs::path& repo_root)
    {
        return Init(repo_root, PathResolver::ConfiguredBaseRoot());
    }

} // namespace devsecrets::paths
