// src/common/env/EnvManager.hpp
#pragma once
#include "EnvConfig.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace devsecrets::env
{
    /**
     * @brief 글로벌 설정 관리자 (싱글톤)
     *
     * 프로세스 환경 변수를 기본으로 하고, 지정된 .env 파일 값을 그 아래에 깐다.
     * 같은 키가 양쪽에 있으면 프로세스 환경 변수가 우선한다.
     */
    class EnvManager
    {
    private:
        static std::unique_ptr<EnvManager> instance;
        static std::mutex instance_mutex;

        std::unique_ptr<EnvConfig> env_config;
        mutable std::mutex config_mutex;

        std::string env_file;
        bool is_initialized = false;

        EnvManager() = default;

        std::unique_ptr<EnvConfig> LoadConfig(const std::string& file) const;

    public:
        ~EnvManager() = default;

        // 복사/이동 방지
        EnvManager(const EnvManager&) = delete;
        EnvManager& operator=(const EnvManager&) = delete;
        EnvManager(EnvManager&&) = delete;
        EnvManager& operator=(EnvManager&&) = delete;

        /**
         * @brief 싱글톤 인스턴스 획득
         */
        static EnvManager& Instance();

        /**
         * @brief 환경 설정 초기화
         * @param file .env 형식 파일 경로. 비어 있으면 DEVSECRETS_ENV_FILE 을 확인하고,
         *             그것도 없으면 프로세스 환경만 사용
         * @return 초기화 성공 여부 (파일을 열 수 없으면 false)
         */
        bool Initialize(const std::string& file = "");

        /**
         * @brief 아직 초기화되지 않았다면 프로세스 환경으로 초기화
         *
         * 호스트 프로그램이 Initialize 를 호출하지 않은 채 라이브러리를 쓸 때 사용.
         */
        void EnsureLoaded();

        bool IsInitialized() const;

        /**
         * @brief 환경 설정 객체 접근
         * @return EnvConfig 참조 (초기화되지 않았으면 예외 발생)
         */
        const EnvConfig& GetConfig() const;

        std::string GetString(const std::string& key) const;
        std::filesystem::path GetPath(const std::string& key) const;
        bool HasKey(const std::string& key) const;
        void ValidateRequired(const std::vector<std::string>& required_keys) const;

        /**
         * @brief 설정 재로드 (환경 변수가 바뀐 뒤 다시 읽을 때 사용)
         */
        bool Reload();

    private:
        void EnsureInitialized() const;
    };

    /**
     * @brief 전역 설정 접근을 위한 편의 함수들
     */
    namespace Config
    {
        inline std::string GetString(const std::string& key) {
            return EnvManager::Instance().GetString(key);
        }

        inline std::filesystem::path GetPath(const std::string& key) {
            return EnvManager::Instance().GetPath(key);
        }

        inline bool HasKey(const std::string& key) {
            return EnvManager::Instance().HasKey(key);
        }

        inline void ValidateRequired(const std::vector<std::string>& required_keys) {
            EnvManager::Instance().ValidateRequired(required_keys);
        }

        inline bool IsInitialized() {
            return EnvManager::Instance().IsInitialized();
        }
    }

} // namespace devsecrets::env
