// src/common/paths/src/PathResolver.cpp
#include "common/paths/include/PathResolver.hpp"
#include "common/env/EnvManager.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cstdlib>

namespace devsecrets::paths
{
    namespace
    {
        const char* GetEnvNonEmpty(const char* name)
        {
            const char* raw = std::getenv(name);
            return (raw && *raw) ? raw : nullptr;
        }

        SecretsIoException NoDataDir(const char* variable)
        {
            return SecretsIoException(std::string("Cannot determine local data directory, ") +
                                      variable + " is not set", fs::path(),
                                      std::make_error_code(std::errc::no_such_file_or_directory));
        }
    }

    fs::path PathResolver::Resolve(const fs::path& root, const identifier::Identifier& id)
    {
        if (root.empty()) {
            throw SecretsIoException("Secrets base root must not be empty", root,
                                     std::make_error_code(std::errc::invalid_argument));
        }
        return root / id.Text();
    }

    fs::path PathResolver::LocalDataDir()
    {
#if defined(__APPLE__)
        const char* home = GetEnvNonEmpty("HOME");
        if (!home) {
            throw NoDataDir("HOME");
        }
        return fs::path(home) / "Library" / "Application Support";
#else
        // XDG Base Directory: 상대 경로 값은 무효로 취급
        const char* xdg = GetEnvNonEmpty("XDG_DATA_HOME");
        if (xdg && fs::path(xdg).is_absolute()) {
            return fs::path(xdg);
        }
        const char* home = GetEnvNonEmpty("HOME");
        if (!home) {
            throw NoDataDir("HOME");
        }
        return fs::path(home) / ".local" / "share";
#endif
    }

    fs::path PathResolver::DefaultBaseRoot()
    {
        return LocalDataDir() / BASE_ROOT_DIR_NAME;
    }

    fs::path PathResolver::ConfiguredBaseRoot()
    {
        env::EnvManager::Instance().EnsureLoaded();

        if (env::Config::HasKey(env::KEY_ROOT)) {
            fs::path root = env::Config::GetPath(env::KEY_ROOT);
            std::error_code ec;
            fs::path absolute_root = fs::absolute(root, ec);
            if (ec) {
                throw SecretsIoException("Failed to resolve configured base root", root, ec);
            }
            DEVSECRETS_LOG_DEBUGF("PathResolver", "Using configured base root %s", absolute_root.c_str());
            return absolute_root;
        }

        return DefaultBaseRoot();
    }

} // namespace devsecrets::paths
