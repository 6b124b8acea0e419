// src/common/secrets/src/SecretsAccessor.cpp
#include "common/secrets/include/SecretsAccessor.hpp"
#include "common/paths/include/PathResolver.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"

namespace devsecrets::secrets
{
    std::optional<SecretsHandle> SecretsAccessor::FromId(const identifier::Identifier& id)
    {
        return FromId(id, paths::PathResolver::ConfiguredBaseRoot());
    }

    std::optional<SecretsHandle> SecretsAccessor::FromId(const identifier::Identifier& id,
                                                         const std::filesystem::path& base_root)
    {
        const fs::path dir = paths::PathResolver::Resolve(base_root, id);

        std::error_code ec;
        fs::file_status st = fs::status(dir, ec);
        if (st.type() == fs::file_type::not_found) {
            DEVSECRETS_LOG_DEBUGF("SecretsAccessor", "Secrets directory not initialized: %s", dir.c_str());
            return std::nullopt;
        }
        if (ec) {
            throw SecretsIoException("Failed to stat secrets directory", dir, ec);
        }
        if (!fs::is_directory(st)) {
            throw SecretsIoException("Secrets path exists but is not a directory", dir,
                                     std::make_error_code(std::errc::not_a_directory));
        }

        DEVSECRETS_LOG_DEBUGF("SecretsAccessor", "Using secrets directory: %s", dir.c_str());
        return SecretsHandle(dir);
    }

} // namespace devsecrets::secrets
