// src/common/bind/src/IdBinder.cpp
#include "common/bind/include/IdBinder.hpp"
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>

namespace devsecrets::bind
{
    namespace
    {
        // 경로를 주석에 넣을 때 "*/" 가 끼어들지 않도록
        std::string SanitizeForComment(const std::string& s)
        {
            std::string out;
            out.reserve(s.size());
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '*' && i + 1 < s.size() && s[i + 1] == '/') {
                    out += "* /";
                    ++i;
                } else if (s[i] == '\n' || s[i] == '\r') {
                    out += ' ';
                } else {
                    out += s[i];
                }
            }
            return out;
        }
    }

    identifier::Identifier IdBinder::LoadBoundId(const fs::path& id_file)
    {
        return identifier::IdentifierStore::Read(id_file);
    }

    std::string IdBinder::RenderHeader(const identifier::Identifier& id, const fs::path& id_file)
    {
        std::ostringstream out;
        out << "/* Generated by devsecrets-bind. Do not edit.\n"
            << " * Source: " << SanitizeForComment(id_file.string()) << "\n"
            << " */\n"
            << "#pragma once\n"
            << "\n"
            << "#define " << BOUND_ID_MACRO << " \"" << id.Text() << "\"\n"
            << "\n"
            << "#ifdef __cplusplus\n"
            << "#include \"common/identifier/include/Identifier.hpp\"\n"
            << "\n"
            << "namespace devsecrets::bound\n"
            << "{\n"
            << "    constexpr const char* kIdText = " << BOUND_ID_MACRO << ";\n"
            << "\n"
            << "    inline const devsecrets::identifier::Identifier& Id()\n"
            << "    {\n"
            << "        static const devsecrets::identifier::Identifier id =\n"
            << "            devsecrets::identifier::Identifier::Parse(kIdText);\n"
            << "        return id;\n"
            << "    }\n"
            << "} // namespace devsecrets::bound\n"
            << "#endif\n";
        return out.str();
    }

    bool IdBinder::WriteHeader(const fs::path& output, const std::string& content)
    {
        {
            std::ifstream existing(output, std::ios::in | std::ios::binary);
            if (existing.is_open()) {
                std::string current((std::istreambuf_iterator<char>(existing)),
                                    std::istreambuf_iterator<char>());
                if (current == content) {
                    DEVSECRETS_LOG_DEBUGF("IdBinder", "Header up to date: %s", output.c_str());
                    return false;
                }
            }
        }

        if (output.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(output.parent_path(), ec);
            if (ec) {
                throw SecretsIoException("Failed to create output directory", output.parent_path(), ec);
            }
        }

        errno = 0;
        std::ofstream file(output, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw SecretsIoException("Failed to open output header", output,
                                     errno != 0 ? std::error_code(errno, std::generic_category())
                                                : std::make_error_code(std::errc::io_error));
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if (!file) {
            throw SecretsIoException("Failed to write output header", output,
                                     std::make_error_code(std::errc::io_error));
        }

        DEVSECRETS_LOG_DEBUGF("IdBinder", "Wrote header: %s", output.c_str());
        return true;
    }

} // namespace devsecrets::bind
