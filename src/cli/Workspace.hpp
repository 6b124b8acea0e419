// src/cli/Workspace.hpp
#pragma once
#include <filesystem>

namespace devsecrets::cli
{
    namespace fs = std::filesystem;

    /**
     * @brief --repo 가 없을 때 사용할 저장소 루트 탐색
     *
     * start 에서 위로 올라가며
     * 1. .devsecrets_id.txt 가 있는 가장 가까운 디렉토리
     * 2. 없으면 .git 이 있는 가장 가까운 디렉토리
     * 3. 둘 다 없으면 start 자신
     */
    fs::path FindRepoRoot(const fs::path& start);

} // namespace devsecrets::cli
