// src/common/paths/include/DirectoryInitializer.hpp
#pragma once
#include "common/identifier/include/Identifier.hpp"
#include <filesystem>

namespace devsecrets::paths
{
    namespace fs = std::filesystem;

    /**
     * @brief init 결과
     */
    struct InitResult
    {
        identifier::Identifier id;
        fs::path id_file;
        fs::path secrets_dir;
        bool id_created;   // 식별자 파일을 이번에 새로 만들었는지
        bool dir_created;  // 시크릿 디렉토리를 이번에 새로 만들었는지
    };

    /**
     * @brief 시크릿 디렉토리 생성 (멱등)
     *
     * "없으면 생성" 의미. 이미 있으면 조용히 성공하고,
     * 기존 시크릿 파일은 절대 지우지 않는다.
     */
    class DirectoryInitializer
    {
    public:
        /**
         * @brief path 와 없는 상위 디렉토리들을 생성
         * @param created 새로 만들었으면 true 기록 (nullptr 허용)
         * @return path (존재가 보장됨)
         * @throws SecretsIoException 권한/디스크 오류, 또는 디렉토리가 아닌 것이 이미 있을 때
         *
         * 새로 만든 마지막 디렉토리는 소유자 전용(0700) 권한으로 설정한다.
         */
        static fs::path EnsureDirectory(const fs::path& path, bool* created = nullptr);

        /**
         * @brief 저장소 초기화
         *
         * 1. repo_root/.devsecrets_id.txt 를 읽거나 생성
         * 2. base_root 기준으로 시크릿 디렉토리 경로 결정
         * 3. EnsureDirectory
         *
         * @throws SecretsIoException repo_root 가 디렉토리가 아니거나 파일 시스템 오류
         * @throws MalformedIdentifierException 기존 식별자 파일이 손상된 경우
         */
        static InitResult Init(const fs::path& repo_root, const fs::path& base_root);

        /**
         * @brief PathResolver::ConfiguredBaseRoot() 를 루트로 사용하는 Init
         */
        static InitResult Init(const fs::path& repo_root);

    private:
        DirectoryInitializer() = delete;
    };

} // namespace devsecrets::paths
