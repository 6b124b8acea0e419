// src/common/paths/include/PathResolver.hpp
#pragma once
#include "common/identifier/include/Identifier.hpp"
#include <filesystem>

namespace devsecrets::paths
{
    namespace fs = std::filesystem;

    // 로컬 데이터 디렉토리 아래에 만드는 기본 루트 이름
    constexpr const char* BASE_ROOT_DIR_NAME = "devsecrets";

    /**
     * @brief 식별자 -> 시크릿 디렉토리 경로 매핑
     *
     * Resolve 는 순수 함수: 같은 (root, id) 는 항상 같은 경로.
     * 식별자 텍스트를 그대로 마지막 디렉토리 이름으로 사용하므로
     * 서로 다른 식별자가 같은 경로로 매핑되지 않는다.
     */
    class PathResolver
    {
    public:
        /**
         * @brief root / id.Text()
         * @throws SecretsIoException root 가 비어 있을 때 (invalid_argument)
         */
        static fs::path Resolve(const fs::path& root, const identifier::Identifier& id);

        /**
         * @brief OS 규약의 사용자별 로컬 데이터 디렉토리
         *
         * - Linux 등: $XDG_DATA_HOME (절대 경로일 때만), 없으면 $HOME/.local/share
         * - macOS: $HOME/Library/Application Support
         *
         * @throws SecretsIoException 위치를 결정할 수 없을 때
         */
        static fs::path LocalDataDir();

        /**
         * @brief LocalDataDir() / "devsecrets"
         */
        static fs::path DefaultBaseRoot();

        /**
         * @brief DEVSECRETS_ROOT 설정값이 있으면 그 값(절대 경로로 변환), 없으면 DefaultBaseRoot()
         *
         * EnvManager 가 초기화되지 않았다면 프로세스 환경으로 초기화한다.
         */
        static fs::path ConfiguredBaseRoot();

    private:
        PathResolver() = delete;
    };

} // namespace devsecrets::paths
