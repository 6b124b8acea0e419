// src/common/identifier/include/Identifier.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace devsecrets::identifier
{
    // "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx"
    constexpr size_t IDENTIFIER_TEXT_LENGTH = 36;
    constexpr size_t IDENTIFIER_BYTE_LENGTH = 16;

    /**
     * @brief 저장소와 시크릿 디렉토리를 묶는 불변 식별자
     *
     * 랜덤 UUID(v4) 를 소문자 하이픈 형식으로 인코딩한 값.
     * 텍스트는 [0-9a-f-] 만 포함하므로 그대로 디렉토리 이름으로 쓸 수 있다.
     */
    class Identifier
    {
    public:
        /**
         * @brief 16 바이트 랜덤 값으로 식별자 생성
         *
         * 버전(4)/variant 비트를 설정한 뒤 인코딩한다.
         */
        static Identifier FromRandomBytes(const std::array<uint8_t, IDENTIFIER_BYTE_LENGTH>& bytes);

        /**
         * @brief 텍스트 형식 파싱
         * @param text 식별자 텍스트 (끝의 줄바꿈 하나는 허용)
         * @return 소문자로 정규화된 식별자
         * @throws MalformedIdentifierException 길이/문자/토큰 수가 맞지 않을 때
         */
        static Identifier Parse(const std::string& text);

        /**
         * @brief 파싱 가능 여부만 확인 (예외 없음)
         */
        static bool IsValid(const std::string& text);

        const std::string& Text() const { return text_; }

        bool operator==(const Identifier& other) const { return text_ == other.text_; }
        bool operator!=(const Identifier& other) const { return text_ != other.text_; }
        bool operator<(const Identifier& other) const { return text_ < other.text_; }

    private:
        explicit Identifier(std::string text);

        std::string text_;
    };

} // namespace devsecrets::identifier
