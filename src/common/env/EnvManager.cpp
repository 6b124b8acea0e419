// src/common/env/EnvManager.cpp
#include "EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cstdlib>

namespace devsecrets::env
{
    // 정적 멤버 초기화
    std::unique_ptr<EnvManager> EnvManager::instance = nullptr;
    std::mutex EnvManager::instance_mutex;

    EnvManager& EnvManager::Instance()
    {
        std::lock_guard<std::mutex> lock(instance_mutex);

        if (!instance) {
            // private 생성자라 make_unique 사용 불가
            instance = std::unique_ptr<EnvManager>(new EnvManager());
        }

        return *instance;
    }

    std::unique_ptr<EnvConfig> EnvManager::LoadConfig(const std::string& file) const
    {
        auto config = std::make_unique<EnvConfig>();

        std::string path = file;
        if (path.empty()) {
            const char* from_env = std::getenv(KEY_ENV_FILE);
            if (from_env && *from_env) {
                path = from_env;
            }
        }

        if (!path.empty() && !config->LoadFromFile(path)) {
            return nullptr;
        }

        // 프로세스 환경 변수가 파일 값보다 우선
        config->LoadFromProcess(EnvConfig::KnownKeys());
        return config;
    }

    bool EnvManager::Initialize(const std::string& file)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            DEVSECRETS_LOG_DEBUG("EnvManager", "Already initialized");
            return file.empty() || file == env_file;
        }

        env_config = LoadConfig(file);
        if (!env_config) {
            DEVSECRETS_LOG_ERRORF("EnvManager", "Failed to load environment configuration: %s", file.c_str());
            return false;
        }

        env_file = file;
        is_initialized = true;
        DEVSECRETS_LOG_DEBUGF("EnvManager", "Initialized with %zu entries", env_config->Size());
        return true;
    }

    void EnvManager::EnsureLoaded()
    {
        if (IsInitialized()) {
            return;
        }
        if (!Initialize()) {
            throw DevSecretsException("Failed to load devsecrets configuration from the process environment");
        }
    }

    bool EnvManager::IsInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        return is_initialized;
    }

    const EnvConfig& EnvManager::GetConfig() const
    {
        EnsureInitialized();
        return *env_config;
    }

    void EnvManager::EnsureInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!is_initialized || !env_config) {
            throw DevSecretsException(
                "EnvManager not initialized. Call EnvManager::Instance().Initialize() first."
            );
        }
    }

    std::string EnvManager::GetString(const std::string& key) const
    {
        return GetConfig().GetString(key);
    }

    std::filesystem::path EnvManager::GetPath(const std::string& key) const
    {
        return GetConfig().GetPath(key);
    }

    bool EnvManager::HasKey(const std::string& key) const
    {
        return GetConfig().HasKey(key);
    }

    void EnvManager::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        GetConfig().ValidateRequired(required_keys);
    }

    bool EnvManager::Reload()
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (!is_initialized || !env_config) {
            DEVSECRETS_LOG_ERROR("EnvManager", "Cannot reload: EnvManager not initialized");
            return false;
        }

        auto reloaded = LoadConfig(env_file);
        if (!reloaded) {
            DEVSECRETS_LOG_ERRORF("EnvManager", "Failed to reload environment configuration: %s", env_file.c_str());
            return false;
        }

        env_config = std::move(reloaded);
        DEVSECRETS_LOG_DEBUG("EnvManager", "Configuration reloaded");
        return true;
    }

} // namespace devsecrets::env
