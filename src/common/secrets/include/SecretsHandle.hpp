// src/common/secrets/include/SecretsHandle.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace devsecrets::secrets
{
    namespace fs = std::filesystem;

    class SecretSource;
    class SecretsAccessor;

    /**
     * @brief 존재가 확인된 시크릿 디렉토리에 대한 읽기 전용 핸들
     *
     * SecretsAccessor::FromId 로만 얻을 수 있다.
     * 모든 읽기는 상대 이름을 받아 디렉토리 안의 경로로 바꾼 뒤 수행하며,
     * 디렉토리 밖을 가리키는 이름은 파일 시스템에 접근하기 전에 거부한다.
     *
     * 쓰기 기능은 없다. 시크릿 파일은 사용자가 직접 디렉토리에 넣는다.
     *
     * 사용 예시:
     * ```cpp
     * auto handle = SecretsAccessor::FromId(devsecrets::bound::Id());
     * if (handle) {
     *     std::string token = handle->ReadText("api_key.txt");
     * }
     * ```
     */
    class SecretsHandle
    {
    public:
        const fs::path& Directory() const { return dir_; }

        /**
         * @brief 상대 이름 -> 디렉토리 안의 절대 경로 (파일 시스템 접근 없음)
         * @throws InvalidSecretPathException 비어 있거나, 절대 경로이거나, "." / ".." 구성요소를 포함할 때
         *
         * 예 (유닉스):
         * - "mysecret.txt"       유효
         * - "a/b/c.txt"          유효
         * - "/etc/passwd"        무효
         * - "../../other.txt"    무효
         * - "a/../d/e.txt"       무효
         */
        fs::path ResolvePath(const std::string& name) const;

        /**
         * @brief 일반 파일로 존재하는지 확인
         * @throws InvalidSecretPathException
         * @throws SecretsIoException 권한 오류 등
         */
        bool Exists(const std::string& name) const;

        /**
         * @brief 바이너리 읽기
         * @throws InvalidSecretPathException
         * @throws SecretNotFoundException 파일이 없을 때
         * @throws SecretsIoException 그 외 파일 시스템 오류
         */
        std::vector<uint8_t> ReadBytes(const std::string& name) const;

        /**
         * @brief 텍스트 읽기 (UTF-8 검증)
         * @throws SecretParseException UTF-8 이 아닐 때
         */
        std::string ReadText(const std::string& name) const;

        /**
         * @brief 스트림으로 열기
         */
        std::ifstream OpenReader(const std::string& name) const;

        /**
         * @brief 포맷 지정 읽기를 위한 빌더
         *
         * ```cpp
         * auto config = handle->ReadFrom("service.json")
         *                   .WithFormat(JsonFormat{})
         *                   .IntoValue<nlohmann::json>();
         * ```
         */
        SecretSource ReadFrom(const std::string& name) const;

    private:
        friend class SecretsAccessor;

        explicit SecretsHandle(fs::path dir);

        // 존재/타입 확인 후 전체 경로 반환
        fs::path RequireRegularFile(const std::string& name) const;

        fs::path dir_;
    };

} // namespace devsecrets::secrets
