// src/common/env/EnvConfig.cpp
#include "EnvConfig.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace devsecrets::env
{
    bool EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            DEVSECRETS_LOG_ERRORF("EnvConfig", "Failed to open config file: %s", file_path.c_str());
            return false;
        }

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            if (!ParseLine(line)) {
                DEVSECRETS_LOG_WARNF("EnvConfig", "Ignoring malformed line %zu in %s", line_no, file_path.c_str());
            }
        }

        is_loaded = true;
        DEVSECRETS_LOG_DEBUGF("EnvConfig", "Loaded %zu configuration entries from %s",
                              config_map.size(), file_path.c_str());
        return true;
    }

    void EnvConfig::LoadFromProcess(const std::vector<std::string>& keys)
    {
        for (const std::string& key : keys) {
            const char* raw = std::getenv(key.c_str());
            if (raw && *raw) {
                config_map[key] = raw;
            }
        }
        is_loaded = true;
    }

    void EnvConfig::Set(const std::string& key, const std::string& value)
    {
        config_map[key] = value;
    }

    std::string EnvConfig::GetString(const std::string& key) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            throw ConfigMissingException(key);
        }
        return it->second;
    }

    bool EnvConfig::GetBool(const std::string& key) const
    {
        std::string value = GetString(key);  // 예외 발생 가능

        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            return true;
        } else if (value == "false" || value == "0" || value == "no" || value == "off") {
            return false;
        } else {
            throw DevSecretsException("Invalid boolean value for key '" + key + "': " + value);
        }
    }

    std::filesystem::path EnvConfig::GetPath(const std::string& key) const
    {
        std::string value = GetString(key);  // 예외 발생 가능

        // "~/" 로 시작하면 HOME 기준으로 확장
        if (value.size() >= 2 && value[0] == '~' && value[1] == '/') {
            const char* home = std::getenv("HOME");
            if (home && *home) {
                return std::filesystem::path(home) / value.substr(2);
            }
        }
        return std::filesystem::path(value);
    }

    bool EnvConfig::HasKey(const std::string& key) const
    {
        auto it = config_map.find(key);
        return it != config_map.end() && !it->second.empty();
    }

    void EnvConfig::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        std::vector<std::string> missing_keys;

        for (const std::string& key : required_keys) {
            if (!HasKey(key)) {
                missing_keys.push_back(key);
            }
        }

        if (!missing_keys.empty()) {
            std::stringstream ss;
            for (size_t i = 0; i < missing_keys.size(); ++i) {
                ss << missing_keys[i];
                if (i < missing_keys.size() - 1) {
                    ss << ", ";
                }
            }
            throw ConfigMissingException(ss.str());
        }
    }

    std::vector<std::string> EnvConfig::KnownKeys()
    {
        return { KEY_ROOT, KEY_LOG_LEVEL, KEY_LOG_FILE, KEY_ENV_FILE };
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        // 앞뒤 공백 제거
        std::string trimmed = line;
        trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
        trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        // 쉘에서 source 하는 파일과 호환
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed.erase(0, 7);
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = trimmed.substr(0, eq_pos);
        std::string value = trimmed.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);

        // 양쪽 따옴표 제거
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty())
        {
            config_map[key] = value;
            return true;
        }

        return false;
    }
} // namespace devsecrets::env
