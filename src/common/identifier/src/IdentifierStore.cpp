// src/common/identifier/src/IdentifierStore.cpp
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <openssl/rand.h>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace devsecrets::identifier
{
    namespace
    {
        // 정상 파일은 37 바이트 이하. 큰 파일은 끝까지 읽지 않는다.
        constexpr size_t MAX_IDENTIFIER_FILE_SIZE = 256;

        std::error_code LastError()
        {
            return std::error_code(errno, std::generic_category());
        }

        std::error_code WriteAll(int fd, const std::string& data)
        {
            size_t written = 0;
            while (written < data.size()) {
                ssize_t n = ::write(fd, data.data() + written, data.size() - written);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return LastError();
                }
                written += static_cast<size_t>(n);
            }
            return {};
        }
    }

    Identifier IdentifierStore::Generate()
    {
        std::array<uint8_t, IDENTIFIER_BYTE_LENGTH> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw DevSecretsException("Failed to generate random bytes for identifier");
        }
        return Identifier::FromRandomBytes(bytes);
    }

    Identifier IdentifierStore::Read(const fs::path& path)
    {
        auto id = TryRead(path);
        if (!id) {
            throw SecretsIoException("Identifier file does not exist", path,
                                     std::make_error_code(std::errc::no_such_file_or_directory));
        }
        return *id;
    }

    std::optional<Identifier> IdentifierStore::TryRead(const fs::path& path)
    {
        std::error_code ec;
        fs::file_status st = fs::status(path, ec);

        if (st.type() == fs::file_type::not_found) {
            return std::nullopt;
        }
        if (ec) {
            throw SecretsIoException("Failed to stat identifier file", path, ec);
        }
        if (!fs::is_regular_file(st)) {
            throw SecretsIoException("Identifier file is not a regular file", path,
                                     std::make_error_code(std::errc::invalid_argument));
        }

        errno = 0;
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            if (errno == ENOENT) {
                return std::nullopt;
            }
            std::error_code open_ec = errno != 0 ? LastError() : std::make_error_code(std::errc::io_error);
            throw SecretsIoException("Failed to open identifier file", path, open_ec);
        }

        char buffer[MAX_IDENTIFIER_FILE_SIZE + 1];
        file.read(buffer, sizeof(buffer));
        if (file.bad()) {
            throw SecretsIoException("Failed to read identifier file", path,
                                     std::make_error_code(std::errc::io_error));
        }

        const size_t size = static_cast<size_t>(file.gcount());
        if (size > MAX_IDENTIFIER_FILE_SIZE) {
            throw MalformedIdentifierException(path, "file is too large");
        }

        try {
            Identifier id = Identifier::Parse(std::string(buffer, size));
            DEVSECRETS_LOG_DEBUGF("IdentifierStore", "Read identifier %s from %s",
                                  id.Text().c_str(), path.c_str());
            return id;
        } catch (const MalformedIdentifierException& e) {
            throw MalformedIdentifierException(path, e.Detail());
        }
    }

    bool IdentifierStore::WriteIfAbsent(const fs::path& path, const Identifier& id)
    {
        fs::path dir = path.parent_path();
        if (dir.empty()) {
            dir = ".";
        }

        std::string pattern = (dir / (path.filename().string() + ".XXXXXX")).string();
        std::vector<char> tmp_name(pattern.begin(), pattern.end());
        tmp_name.push_back('\0');

        int fd = ::mkstemp(tmp_name.data());
        if (fd < 0) {
            throw SecretsIoException("Failed to create temporary identifier file", dir, LastError());
        }
        const fs::path tmp_path(tmp_name.data());

        // 식별자 텍스트만 기록 (줄바꿈 없음)
        std::error_code write_ec = WriteAll(fd, id.Text());
        if (!write_ec && ::fchmod(fd, 0644) != 0) {
            write_ec = LastError();
        }
        if (!write_ec && ::fsync(fd) != 0) {
            write_ec = LastError();
        }
        if (::close(fd) != 0 && !write_ec) {
            write_ec = LastError();
        }
        if (write_ec) {
            ::unlink(tmp_path.c_str());
            throw SecretsIoException("Failed to write identifier file", tmp_path, write_ec);
        }

        // link 는 대상이 이미 있으면 EEXIST 로 실패 (덮어쓰지 않음)
        const int link_result = ::link(tmp_path.c_str(), path.c_str());
        const int link_errno = errno;
        ::unlink(tmp_path.c_str());

        if (link_result == 0) {
            DEVSECRETS_LOG_INFOF("IdentifierStore", "Created identifier file %s", path.c_str());
            return true;
        }
        if (link_errno == EEXIST) {
            DEVSECRETS_LOG_DEBUGF("IdentifierStore", "Identifier file already exists: %s", path.c_str());
            return false;
        }
        if (link_errno == EPERM || link_errno == EOPNOTSUPP || link_errno == ENOSYS) {
            DEVSECRETS_LOG_DEBUG("IdentifierStore", "Hard links unsupported, falling back to O_EXCL create");
            bool created = CreateExclusive(path, id);
            if (created) {
                DEVSECRETS_LOG_INFOF("IdentifierStore", "Created identifier file %s", path.c_str());
            }
            return created;
        }

        throw SecretsIoException("Failed to publish identifier file", path,
                                 std::error_code(link_errno, std::generic_category()));
    }

    bool IdentifierStore::CreateExclusive(const fs::path& path, const Identifier& id)
    {
        const std::string& text = id.Text();
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            if (errno == EEXIST) {
                return false;
            }
            throw SecretsIoException("Failed to create identifier file", path, LastError());
        }

        std::error_code ec = WriteAll(fd, text);
        if (!ec && ::fsync(fd) != 0) {
            ec = LastError();
        }
        if (::close(fd) != 0 && !ec) {
            ec = LastError();
        }
        if (ec) {
            ::unlink(path.c_str());
            throw SecretsIoException("Failed to write identifier file", path, ec);
        }
        return true;
    }

    EnsuredIdentifier IdentifierStore::Ensure(const fs::path& path)
    {
        if (auto existing = TryRead(path)) {
            return { *existing, false };
        }

        Identifier fresh = Generate();
        if (WriteIfAbsent(path, fresh)) {
            return { fresh, true };
        }

        // 다른 프로세스가 먼저 기록함: 그쪽 값을 따른다
        DEVSECRETS_LOG_INFOF("IdentifierStore", "Lost identifier creation race, reading back %s", path.c_str());
        return { Read(path), false };
    }

} // namespace devsecrets::identifier
