// src/cli/Commands.cpp
#include "Commands.hpp"
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/paths/include/DirectoryInitializer.hpp"
#include "common/secrets/include/SecretsAccessor.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"

namespace devsecrets::cli
{
    int RunInit(const fs::path& repo_root, const fs::path& base_root, std::ostream& out)
    {
        try {
            paths::InitResult result = paths::DirectoryInitializer::Init(repo_root, base_root);

            if (result.id_created) {
                DEVSECRETS_LOG_INFOF("Init", "Created %s, commit it to the repository",
                                     result.id_file.c_str());
            }
            out << "Dir: " << result.secrets_dir.string() << std::endl;
            return 0;

        } catch (const MalformedIdentifierException& e) {
            DEVSECRETS_LOG_ERRORF("Init", "%s", e.what());
            return 1;
        } catch (const DevSecretsException& e) {
            DEVSECRETS_LOG_ERRORF("Init", "Failed to initialize: %s", e.what());
            return 1;
        }
    }

    int RunPath(const fs::path& repo_root, const fs::path& base_root, std::ostream& out)
    {
        const fs::path id_file = repo_root / identifier::IDENTIFIER_FILE_NAME;

        try {
            std::optional<identifier::Identifier> id = identifier::IdentifierStore::TryRead(id_file);
            if (!id) {
                DEVSECRETS_LOG_ERRORF("Path", "No identifier file at %s, run 'devsecrets init' first",
                                      id_file.c_str());
                return 1;
            }

            std::optional<secrets::SecretsHandle> handle = secrets::SecretsAccessor::FromId(*id, base_root);
            if (!handle) {
                DEVSECRETS_LOG_ERRORF("Path", "Secrets directory for %s does not exist, run 'devsecrets init' first",
                                      id->Text().c_str());
                return 1;
            }

            out << handle->Directory().string() << std::endl;
            return 0;

        } catch (const DevSecretsException& e) {
            DEVSECRETS_LOG_ERRORF("Path", "%s", e.what());
            return 1;
        }
    }

} // namespace devsecrets::cli
