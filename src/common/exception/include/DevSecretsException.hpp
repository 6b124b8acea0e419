// src/common/exception/include/DevSecretsException.hpp
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace devsecrets
{
    /**
     * @brief devsecrets 기본 예외 클래스
     *
     * 라이브러리가 던지는 모든 예외의 공통 부모.
     * "아직 init 되지 않음" 상태는 예외가 아니라 빈 std::optional 로 표현한다.
     */
    class DevSecretsException : public std::runtime_error
    {
    public:
        explicit DevSecretsException(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @brief 식별자 파일 내용이 형식에 맞지 않을 때 발생
     */
    class MalformedIdentifierException : public DevSecretsException
    {
    private:
        std::string detail_;

    public:
        explicit MalformedIdentifierException(const std::string& detail)
            : DevSecretsException("Malformed identifier: " + detail)
            , detail_(detail) {}

        MalformedIdentifierException(const std::filesystem::path& source, const std::string& detail)
            : DevSecretsException("Malformed identifier in '" + source.string() + "': " + detail)
            , detail_(detail) {}

        const std::string& Detail() const { return detail_; }
    };

    /**
     * @brief 파일 시스템 하위 레벨 오류
     *
     * 원래의 error_code 와 대상 경로를 그대로 보존한다.
     */
    class SecretsIoException : public DevSecretsException
    {
    private:
        std::filesystem::path path_;
        std::error_code code_;

    public:
        SecretsIoException(const std::string& msg,
                           const std::filesystem::path& path,
                           std::error_code code)
            : DevSecretsException("I/O error: " + msg + " '" + path.string() + "': " + code.message())
            , path_(path)
            , code_(code) {}

        const std::filesystem::path& Path() const { return path_; }
        std::error_code Code() const { return code_; }
    };

    /**
     * @brief 시크릿 디렉토리 밖을 가리키는 상대 경로
     */
    class InvalidSecretPathException : public DevSecretsException
    {
    public:
        InvalidSecretPathException(const std::string& name, const std::string& reason)
            : DevSecretsException("Invalid secret path '" + name + "': " + reason) {}
    };

    /**
     * @brief 시크릿 디렉토리 안에 요청한 파일이 없음
     */
    class SecretNotFoundException : public DevSecretsException
    {
    public:
        explicit SecretNotFoundException(const std::string& name)
            : DevSecretsException("Secret not found: " + name) {}
    };

    class InvalidExtensionException : public DevSecretsException
    {
    public:
        InvalidExtensionException(const std::string& name, const std::string& expected)
            : DevSecretsException("Invalid file extension: '" + name + "' must have a ." + expected + " extension") {}
    };

    /**
     * @brief 시크릿 내용 파싱 실패 (UTF-8 아님, JSON 오류 등)
     */
    class SecretParseException : public DevSecretsException
    {
    public:
        SecretParseException(const std::string& name, const std::string& detail)
            : DevSecretsException("Could not parse secret '" + name + "': " + detail) {}
    };
}
