// src/common/secrets/src/SecretsHandle.cpp
#include "common/secrets/include/SecretsHandle.hpp"
#include "common/secrets/include/SecretSource.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cerrno>
#include <utility>

namespace devsecrets::secrets
{
    namespace
    {
        std::error_code ErrnoOr(std::errc fallback)
        {
            return errno != 0 ? std::error_code(errno, std::generic_category())
                              : std::make_error_code(fallback);
        }

        // 엄격한 UTF-8 검증 (overlong, surrogate, U+10FFFF 초과 거부)
        bool IsValidUtf8(const std::string& s, size_t& bad_offset)
        {
            size_t i = 0;
            const size_t n = s.size();
            while (i < n) {
                const unsigned char c = static_cast<unsigned char>(s[i]);
                size_t len = 0;
                uint32_t cp = 0;

                if (c < 0x80) {
                    ++i;
                    continue;
                } else if ((c & 0xE0) == 0xC0) {
                    len = 2;
                    cp = c & 0x1F;
                } else if ((c & 0xF0) == 0xE0) {
                    len = 3;
                    cp = c & 0x0F;
                } else if ((c & 0xF8) == 0xF0) {
                    len = 4;
                    cp = c & 0x07;
                } else {
                    bad_offset = i;
                    return false;
                }

                if (i + len > n) {
                    bad_offset = i;
                    return false;
                }
                for (size_t k = 1; k < len; ++k) {
                    const unsigned char cc = static_cast<unsigned char>(s[i + k]);
                    if ((cc & 0xC0) != 0x80) {
                        bad_offset = i;
                        return false;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }

                const bool overlong = (len == 2 && cp < 0x80) ||
                                      (len == 3 && cp < 0x800) ||
                                      (len == 4 && cp < 0x10000);
                if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    bad_offset = i;
                    return false;
                }
                i += len;
            }
            return true;
        }
    }

    SecretsHandle::SecretsHandle(fs::path dir)
        : dir_(std::move(dir))
    {
    }

    fs::path SecretsHandle::ResolvePath(const std::string& name) const
    {
        if (name.empty()) {
            throw InvalidSecretPathException(name, "path is empty");
        }
        if (name.find('\0') != std::string::npos) {
            throw InvalidSecretPathException(name, "path contains a NUL character");
        }

        fs::path relative(name);
        if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
            throw InvalidSecretPathException(name, "path must not be absolute");
        }

        // 일반 이름 구성요소만 허용
        bool has_name = false;
        for (const fs::path& part : relative) {
            const std::string component = part.string();
            if (component.empty()) {
                continue;  // 끝의 구분자
            }
            if (component == "." || component == "..") {
                throw InvalidSecretPathException(name, "path has a non-normal component '" + component + "'");
            }
            has_name = true;
        }
        if (!has_name) {
            throw InvalidSecretPathException(name, "path has no file name");
        }

        return dir_ / relative;
    }

    fs::path SecretsHandle::RequireRegularFile(const std::string& name) const
    {
        fs::path full_path = ResolvePath(name);

        std::error_code ec;
        fs::file_status st = fs::status(full_path, ec);
        if (st.type() == fs::file_type::not_found) {
            throw SecretNotFoundException(name);
        }
        if (ec) {
            throw SecretsIoException("Failed to stat secret", full_path, ec);
        }
        if (fs::is_directory(st)) {
            throw SecretsIoException("Secret path is a directory", full_path,
                                     std::make_error_code(std::errc::is_a_directory));
        }
        // FIFO, 소켓, 장치 파일 등은 열지 않는다 (FIFO 는 open 에서 멈춤)
        if (!fs::is_regular_file(st)) {
            throw SecretsIoException("Secret path is not a regular file", full_path,
                                     std::make_error_code(std::errc::invalid_argument));
        }
        return full_path;
    }

    bool SecretsHandle::Exists(const std::string& name) const
    {
        fs::path full_path = ResolvePath(name);

        std::error_code ec;
        fs::file_status st = fs::status(full_path, ec);
        if (st.type() == fs::file_type::not_found) {
            return false;
        }
        if (ec) {
            throw SecretsIoException("Failed to stat secret", full_path, ec);
        }
        return fs::is_regular_file(st);
    }

    std::ifstream SecretsHandle::OpenReader(const std::string& name) const
    {
        fs::path full_path = RequireRegularFile(name);

        errno = 0;
        std::ifstream file(full_path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            // stat 이후 삭제된 경우
            if (errno == ENOENT) {
                throw SecretNotFoundException(name);
            }
            throw SecretsIoException("Failed to open secret", full_path, ErrnoOr(std::errc::io_error));
        }

        DEVSECRETS_LOG_DEBUGF("SecretsHandle", "Opened secret %s", name.c_str());
        return file;
    }

    std::vector<uint8_t> SecretsHandle::ReadBytes(const std::string& name) const
    {
        std::ifstream file = OpenReader(name);
        const fs::path full_path = ResolvePath(name);

        // 파일 크기 확인
        file.seekg(0, std::ios::end);
        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        if (size < 0) {
            throw SecretsIoException("Failed to get secret size", full_path,
                                     std::make_error_code(std::errc::io_error));
        }

        std::vector<uint8_t> data(static_cast<size_t>(size));
        if (size > 0) {
            if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
                throw SecretsIoException("Failed to read secret", full_path,
                                         std::make_error_code(std::errc::io_error));
            }
        }

        return data;
    }

    std::string SecretsHandle::ReadText(const std::string& name) const
    {
        std::vector<uint8_t> bytes = ReadBytes(name);
        std::string text(bytes.begin(), bytes.end());

        size_t bad_offset = 0;
        if (!IsValidUtf8(text, bad_offset)) {
            throw SecretParseException(name, "invalid UTF-8 at byte offset " + std::to_string(bad_offset));
        }
        return text;
    }

    SecretSource SecretsHandle::ReadFrom(const std::string& name) const
    {
        return SecretSource(*this, name);
    }

} // namespace devsecrets::secrets
