// src/common/secrets/include/JsonFormat.hpp
#pragma once

#include "common/exception/include/DevSecretsException.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <string>

namespace devsecrets::secrets
{
    /**
     * @brief JSON 파일 포맷 (.json)
     *
     * SecretSource::WithFormat() 에 넘겨서 사용.
     * T 는 nlohmann::json 이거나 from_json 이 정의된 타입.
     */
    class JsonFormat
    {
    public:
        std::string Extension() const { return "json"; }

        nlohmann::json Parse(std::istream& reader, const std::string& name) const
        {
            try {
                return nlohmann::json::parse(reader);
            } catch (const nlohmann::json::exception& e) {
                throw SecretParseException(name, "JSON parsing failed: " + std::string(e.what()));
            }
        }

        template <typename T>
        T Deserialize(std::istream& reader, const std::string& name) const
        {
            nlohmann::json j = Parse(reader, name);
            try {
                return j.get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw SecretParseException(name, "JSON conversion failed: " + std::string(e.what()));
            }
        }
    };

} // namespace devsecrets::secrets
