// src/common/env/EnvConfig.hpp
#pragma once
#include "common/exception/include/DevSecretsException.hpp"
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace devsecrets::env
{
    // 알려진 설정 키
    constexpr const char* KEY_ROOT = "DEVSECRETS_ROOT";
    constexpr const char* KEY_LOG_LEVEL = "DEVSECRETS_LOG_LEVEL";
    constexpr const char* KEY_LOG_FILE = "DEVSECRETS_LOG_FILE";
    constexpr const char* KEY_ENV_FILE = "DEVSECRETS_ENV_FILE";

    // 설정 누락 예외
    class ConfigMissingException : public DevSecretsException {
    public:
        explicit ConfigMissingException(const std::string& key)
            : DevSecretsException("Required config missing: " + key) {}
    };

    /**
     * @brief KEY=VALUE 형태의 설정 저장소
     *
     * .env 형식 파일과 프로세스 환경 변수에서 값을 읽는다.
     * 빈 값은 설정되지 않은 것으로 취급한다.
     */
    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        bool is_loaded = false;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        // .env 형식 파일 로드 (기존 값 위에 덮어씀)
        bool LoadFromFile(const std::string& file_path);

        // 주어진 키들을 프로세스 환경 변수에서 읽어 덮어씀
        void LoadFromProcess(const std::vector<std::string>& keys);

        void Set(const std::string& key, const std::string& value);

        // 값이 없으면 ConfigMissingException
        std::string GetString(const std::string& key) const;
        bool GetBool(const std::string& key) const;
        std::filesystem::path GetPath(const std::string& key) const;

        bool HasKey(const std::string& key) const;
        bool IsLoaded() const { return is_loaded; }
        size_t Size() const { return config_map.size(); }

        // 여러 필수 키 한번에 검증
        void ValidateRequired(const std::vector<std::string>& required_keys) const;

        // 프로세스 환경에서 읽어 올 기본 키 목록
        static std::vector<std::string> KnownKeys();

    private:
        bool ParseLine(const std::string& line);
    };
} // namespace devsecrets::env
