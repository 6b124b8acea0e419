// src/cli/Commands.hpp
#pragma once
#include <filesystem>
#include <ostream>

namespace devsecrets::cli
{
    namespace fs = std::filesystem;

    /**
     * @brief init: 식별자 파일과 시크릿 디렉토리 생성 (멱등)
     *
     * 성공 시 out 에 "Dir: <경로>" 출력.
     * @return 프로세스 종료 코드 (0 성공, 1 실패)
     */
    int RunInit(const fs::path& repo_root, const fs::path& base_root, std::ostream& out);

    /**
     * @brief path: 시크릿 디렉토리 경로 출력 (아무것도 만들지 않음)
     *
     * 식별자 파일이 없거나 손상됐거나, 디렉토리가 아직 없으면 실패.
     * @return 프로세스 종료 코드 (0 성공, 1 실패)
     */
    int RunPath(const fs::path& repo_root, const fs::path& base_root, std::ostream& out);

} // namespace devsecrets::cli
