// src/common/identifier/src/Identifier.cpp
#include "common/identifier/include/Identifier.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include <cctype>
#include <utility>

namespace devsecrets::identifier
{
    namespace
    {
        constexpr char HEX_DIGITS[] = "0123456789abcdef";

        bool IsHyphenPosition(size_t i)
        {
            return i == 8 || i == 13 || i == 18 || i == 23;
        }

        // 파일 끝의 줄바꿈 하나("\n" 또는 "\r\n")만 허용
        std::string StripSingleLineBreak(const std::string& text)
        {
            if (text.size() >= 2 && text.compare(text.size() - 2, 2, "\r\n") == 0) {
                return text.substr(0, text.size() - 2);
            }
            if (!text.empty() && text.back() == '\n') {
                return text.substr(0, text.size() - 1);
            }
            return text;
        }

        std::string Describe(char c)
        {
            if (std::isprint(static_cast<unsigned char>(c))) {
                return std::string("'") + c + "'";
            }
            static const char* hex = "0123456789ABCDEF";
            unsigned char u = static_cast<unsigned char>(c);
            return std::string("0x") + hex[u >> 4] + hex[u & 0x0F];
        }
    }

    Identifier::Identifier(std::string text)
        : text_(std::move(text))
    {
    }

    Identifier Identifier::FromRandomBytes(const std::array<uint8_t, IDENTIFIER_BYTE_LENGTH>& bytes)
    {
        std::array<uint8_t, IDENTIFIER_BYTE_LENGTH> b = bytes;
        b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
        b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

        std::string text;
        text.reserve(IDENTIFIER_TEXT_LENGTH);
        for (size_t i = 0; i < b.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                text.push_back('-');
            }
            text.push_back(HEX_DIGITS[b[i] >> 4]);
            text.push_back(HEX_DIGITS[b[i] & 0x0F]);
        }
        return Identifier(std::move(text));
    }

    Identifier Identifier::Parse(const std::string& raw)
    {
        const std::string text = StripSingleLineBreak(raw);

        if (text.empty()) {
            throw MalformedIdentifierException("identifier is empty");
        }

        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                throw MalformedIdentifierException("expected exactly one token, found whitespace or extra lines");
            }
        }

        if (text.size() != IDENTIFIER_TEXT_LENGTH) {
            throw MalformedIdentifierException(
                "expected " + std::to_string(IDENTIFIER_TEXT_LENGTH) +
                " characters, got " + std::to_string(text.size()));
        }

        std::string normalized;
        normalized.reserve(IDENTIFIER_TEXT_LENGTH);

        for (size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (IsHyphenPosition(i)) {
                if (c != '-') {
                    throw MalformedIdentifierException(
                        "expected '-' at position " + std::to_string(i) + ", got " + Describe(c));
                }
                normalized.push_back('-');
                continue;
            }
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                throw MalformedIdentifierException(
                    "invalid character " + Describe(c) + " at position " + std::to_string(i));
            }
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        return Identifier(std::move(normalized));
    }

    bool Identifier::IsValid(const std::string& text)
    {
        try {
            Parse(text);
            return true;
        } catch (const MalformedIdentifierException&) {
            return false;
        }
    }

} // namespace devsecrets::identifier
