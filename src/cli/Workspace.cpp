// src/cli/Workspace.cpp
#include "Workspace.hpp"
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/utils/logger/Logger.hpp"
#include <optional>

namespace devsecrets::cli
{
    namespace
    {
        std::optional<fs::path> FindAncestorWith(const fs::path& start, const char* marker)
        {
            for (fs::path dir = start; !dir.empty(); dir = dir.parent_path()) {
                std::error_code ec;
                if (fs::exists(dir / marker, ec)) {
                    return dir;
                }
                if (dir == dir.parent_path()) {
                    break;  // 루트 도달
                }
            }
            return std::nullopt;
        }
    }

    fs::path FindRepoRoot(const fs::path& start)
    {
        std::error_code ec;
        fs::path absolute_start = fs::absolute(start, ec);
        if (ec) {
            absolute_start = start;
        }
        absolute_start = absolute_start.lexically_normal();
        if (!absolute_start.has_filename() && absolute_start != absolute_start.root_path()) {
            absolute_start = absolute_start.parent_path();  // 끝의 '/' 제거
        }

        if (auto found = FindAncestorWith(absolute_start, identifier::IDENTIFIER_FILE_NAME)) {
            DEVSECRETS_LOG_DEBUGF("Workspace", "Repository root (identifier file): %s", found->c_str());
            return *found;
        }
        if (auto found = FindAncestorWith(absolute_start, ".git")) {
            DEVSECRETS_LOG_DEBUGF("Workspace", "Repository root (.git): %s", found->c_str());
            return *found;
        }

        DEVSECRETS_LOG_DEBUGF("Workspace", "No repository marker found, using %s", absolute_start.c_str());
        return absolute_start;
    }

} // namespace devsecrets::cli
