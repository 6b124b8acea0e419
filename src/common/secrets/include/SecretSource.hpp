// src/common/secrets/include/SecretSource.hpp
#pragma once

#include "SecretsHandle.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace devsecrets::secrets
{
    template <typename Format>
    class FormattedSecretSource;

    /**
     * @brief SecretsHandle::ReadFrom() 이 돌려주는 중간 객체
     *
     * 핸들의 복사본을 가지므로 원래 핸들(std::optional 임시 객체 등)보다 오래 살아도 된다.
     */
    class SecretSource
    {
    public:
        SecretSource(SecretsHandle handle, std::string name)
            : handle_(std::move(handle)), name_(std::move(name)) {}

        const std::string& Name() const { return name_; }

        std::vector<uint8_t> ToBytes() const { return handle_.ReadBytes(name_); }

        // UTF-8 이 아니면 SecretParseException
        std::string ToString() const { return handle_.ReadText(name_); }

        std::ifstream ToReader() const { return handle_.OpenReader(name_); }

        /**
         * @brief 지정한 포맷으로 역직렬화하도록 설정
         */
        template <typename Format>
        FormattedSecretSource<Format> WithFormat(Format format) const
        {
            return FormattedSecretSource<Format>(handle_, name_, std::move(format));
        }

    private:
        SecretsHandle handle_;
        std::string name_;
    };

    /**
     * @brief 포맷이 지정된 시크릿 소스
     *
     * Format 요구사항:
     * - std::string Extension() const          기대하는 확장자 ("json" 등)
     * - template <typename T> T Deserialize(std::istream&, const std::string& name) const
     */
    template <typename Format>
    class FormattedSecretSource
    {
    public:
        FormattedSecretSource(SecretsHandle handle, std::string name, Format format)
            : handle_(std::move(handle)), name_(std::move(name)), format_(std::move(format)) {}

        /**
         * @brief 확장자 확인 후 T 로 역직렬화
         * @throws InvalidExtensionException 확장자가 다를 때 (파일 접근 전)
         * @throws SecretParseException 파싱/변환 실패 시
         */
        template <typename T>
        T IntoValue() const
        {
            const std::string expected = format_.Extension();
            // 경로 검증을 먼저 수행
            const fs::path full_path = handle_.ResolvePath(name_);
            if (full_path.extension() != "." + expected) {
                throw InvalidExtensionException(name_, expected);
            }

            std::ifstream reader = handle_.OpenReader(name_);
            return format_.template Deserialize<T>(reader, name_);
        }

    private:
        SecretsHandle handle_;
        std::string name_;
        Format format_;
    };

} // namespace devsecrets::secrets
