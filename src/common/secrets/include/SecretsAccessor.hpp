// src/common/secrets/include/SecretsAccessor.hpp
#pragma once

#include "SecretsHandle.hpp"
#include "SecretSource.hpp"
#include "common/identifier/include/Identifier.hpp"
#include <filesystem>
#include <optional>

namespace devsecrets::secrets
{
    /**
     * @brief 식별자로 시크릿 디렉토리 핸들 획득
     *
     * - 디렉토리가 없으면 std::nullopt ("아직 init 안 됨", 오류 아님)
     * - 디렉토리가 있으면 SecretsHandle
     * - 실제 파일 시스템 오류(권한 등)나 디렉토리 자리에 파일이 있으면 SecretsIoException
     */
    class SecretsAccessor
    {
    public:
        /**
         * @brief 설정된 루트(DEVSECRETS_ROOT 또는 OS 기본값) 기준 조회
         */
        static std::optional<SecretsHandle> FromId(const identifier::Identifier& id);

        /**
         * @brief 지정한 루트 기준 조회
         */
        static std::optional<SecretsHandle> FromId(const identifier::Identifier& id,
                                                   const std::filesystem::path& base_root);

    private:
        SecretsAccessor() = delete;
    };

} // namespace devsecrets::secrets
