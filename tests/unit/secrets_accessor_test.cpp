// tests/unit/secrets_accessor_test.cpp
#include "common/secrets/include/SecretsAccessor.hpp"
#include "common/secrets/include/JsonFormat.hpp"
#include "common/paths/include/DirectoryInitializer.hpp"
#include "common/paths/include/PathResolver.hpp"
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/TestHelpers.hpp"
#include <nlohmann/json.hpp>
#include <cassert>
#include <iostream>
#include <map>
#include <optional>
#include <vector>
#include <sys/stat.h>

using namespace devsecrets;
using namespace devsecrets::identifier;
using namespace devsecrets::paths;
using namespace devsecrets::secrets;
using namespace devsecrets::test;

namespace
{
    struct ServiceCredentials {
        std::string user;
        std::string password;
        int port = 0;
    };

    void from_json(const nlohmann::json& j, ServiceCredentials& c) {
        j.at("user").get_to(c.user);
        j.at("password").get_to(c.password);
        j.at("port").get_to(c.port);
    }

    void ExpectInvalidPath(const SecretsHandle& handle, const std::string& name) {
        try {
            handle.ReadBytes(name);
            assert(false);
        } catch (const InvalidSecretPathException& e) {
            std::string msg = e.what();
            assert(msg.find("Invalid secret path") != std::string::npos);
        }
    }
}

// Test 1: 초기화 전후
bool TestFromIdLifecycle() {
    std::cout << "\n=== Test 1: FromId Lifecycle ===" << std::endl;

    ScratchDir scratch("accessor_lifecycle");
    const fs::path repo = scratch / "repo";
    const fs::path base = scratch / "base";
    fs::create_directories(repo);

    Identifier id = IdentifierStore::Ensure(repo / IDENTIFIER_FILE_NAME).id;
    assert(!SecretsAccessor::FromId(id, base).has_value());
    assert(!fs::exists(base));
    PrintTestResult("Empty before init, nothing created", true);

    InitResult init = DirectoryInitializer::Init(repo, base);
    assert(init.id == id);

    auto handle = SecretsAccessor::FromId(id, base);
    assert(handle.has_value());
    assert(handle->Directory() == PathResolver::Resolve(base, id));
    PrintTestResult("Handle available after init", true);

    return true;
}

// Test 2: 디렉토리 자리에 파일
bool TestFromIdNotADirectory() {
    std::cout << "\n=== Test 2: FromId Not A Directory ===" << std::endl;

    ScratchDir scratch("accessor_notdir");
    Identifier id = IdentifierStore::Generate();
    WriteFile(PathResolver::Resolve(scratch.Path(), id), "file, not directory");

    try {
        SecretsAccessor::FromId(id, scratch.Path());
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::not_a_directory);
        PrintTestResult("File at secrets path is an I/O error", true);
    }

    return true;
}

// Test 3: 읽기
bool TestReads() {
    std::cout << "\n=== Test 3: Reads ===" << std::endl;

    ScratchDir scratch("accessor_reads");
    Identifier id = IdentifierStore::Generate();
    const fs::path dir = DirectoryInitializer::EnsureDirectory(PathResolver::Resolve(scratch.Path(), id));

    const std::string api_key = "sk-test-0123456789\n";
    WriteFile(dir / "api_key.txt", api_key);

    std::string binary;
    for (int i = 0; i < 256; ++i) {
        binary.push_back(static_cast<char>(i));
    }
    WriteFile(dir / "blob.bin", binary);
    WriteFile(dir / "nested/deeper/token.txt", "nested-token");
    WriteFile(dir / "empty.txt", "");

    auto handle = SecretsAccessor::FromId(id, scratch.Path());
    assert(handle.has_value());

    assert(handle->ReadText("api_key.txt") == api_key);
    std::vector<uint8_t> bytes = handle->ReadBytes("api_key.txt");
    assert(std::string(bytes.begin(), bytes.end()) == api_key);
    PrintTestResult("api_key.txt reads back byte-identical", true);

    bytes = handle->ReadBytes("blob.bin");
    assert(bytes.size() == 256);
    for (int i = 0; i < 256; ++i) {
        assert(bytes[i] == static_cast<uint8_t>(i));
    }
    PrintTestResult("Binary content", true);

    assert(handle->ReadText("nested/deeper/token.txt") == "nested-token");
    PrintTestResult("Nested relative path", true);

    assert(handle->ReadBytes("empty.txt").empty());
    assert(handle->ReadText("empty.txt").empty());
    PrintTestResult("Empty file", true);

    std::ifstream reader = handle->OpenReader("api_key.txt");
    std::string line;
    std::getline(reader, line);
    assert(line == "sk-test-0123456789");
    PrintTestResult("OpenReader", true);

    assert(handle->Exists("api_key.txt"));
    assert(!handle->Exists("missing.txt"));
    assert(!handle->Exists("nested"));
    PrintTestResult("Exists", true);

    assert(handle->ResolvePath("a/b.txt") == dir / "a/b.txt");
    PrintTestResult("ResolvePath stays inside directory", true);

    return true;
}

// Test 4: 경로 제한
bool TestContainment() {
    std::cout << "\n=== Test 4: Containment ===" << std::endl;

    ScratchDir scratch("accessor_contain");
    Identifier id = IdentifierStore::Generate();
    DirectoryInitializer::EnsureDirectory(PathResolver::Resolve(scratch.Path(), id));

    // 디렉토리 밖에 있는 파일
    WriteFile(scratch / "outside.txt", "outside");

    auto handle = SecretsAccessor::FromId(id, scratch.Path());
    assert(handle.has_value());

    ExpectInvalidPath(*handle, "../outside.txt");
    ExpectInvalidPath(*handle, "../../other.txt");
    ExpectInvalidPath(*handle, "a/../outside.txt");
    ExpectInvalidPath(*handle, "./api_key.txt");
    ExpectInvalidPath(*handle, "..");
    ExpectInvalidPath(*handle, ".");
    ExpectInvalidPath(*handle, "");
    ExpectInvalidPath(*handle, (scratch / "outside.txt").string());
    ExpectInvalidPath(*handle, "/etc/passwd");
    ExpectInvalidPath(*handle, std::string("a\0b", 3));
    PrintTestResult("Escaping names rejected", true);

    try {
        handle->Exists("../outside.txt");
        assert(false);
    } catch (const InvalidSecretPathException&) {
    }
    try {
        handle->ResolvePath("../outside.txt");
        assert(false);
    } catch (const InvalidSecretPathException&) {
    }
    try {
        handle->ReadFrom("../config.json").WithFormat(JsonFormat{}).IntoValue<nlohmann::json>();
        assert(false);
    } catch (const InvalidSecretPathException&) {
    }
    PrintTestResult("Every entry point validates", true);

    return true;
}

// Test 5: 오류 구분
bool TestErrors() {
    std::cout << "\n=== Test 5: Errors ===" << std::endl;

    ScratchDir scratch("accessor_errors");
    Identifier id = IdentifierStore::Generate();
    const fs::path dir = DirectoryInitializer::EnsureDirectory(PathResolver::Resolve(scratch.Path(), id));
    fs::create_directories(dir / "subdir");
    WriteFile(dir / "latin1.txt", std::string("caf\xE9", 4));
    WriteFile(dir / "utf8.txt", "caf\xC3\xA9 \xF0\x9F\x94\x91");

    auto handle = SecretsAccessor::FromId(id, scratch.Path());
    assert(handle.has_value());

    try {
        handle->ReadBytes("missing.txt");
        assert(false);
    } catch (const SecretNotFoundException& e) {
        std::string msg = e.what();
        assert(msg.find("missing.txt") != std::string::npos);
        PrintTestResult("Missing file is SecretNotFound", true);
    }

    try {
        handle->OpenReader("missing/deeper.txt");
        assert(false);
    } catch (const SecretNotFoundException&) {
        PrintTestResult("Missing parent is SecretNotFound", true);
    }

    try {
        handle->ReadBytes("subdir");
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::is_a_directory);
        PrintTestResult("Directory read is an I/O error", true);
    }

#ifdef __linux__
    // 일반 파일이 아닌 항목 (열면 블록되는 FIFO)
    int rc = ::mkfifo((dir / "pipe").c_str(), 0600);
    assert(rc == 0);
    (void)rc;
    assert(!handle->Exists("pipe"));
    try {
        handle->ReadBytes("pipe");
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::invalid_argument);
    }
    try {
        handle->OpenReader("pipe");
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::invalid_argument);
    }
    try {
        handle->ReadText("pipe");
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::invalid_argument);
    }
    PrintTestResult("FIFO read is an I/O error without blocking", true);
#endif

    assert(handle->ReadText("utf8.txt") == "caf\xC3\xA9 \xF0\x9F\x94\x91");
    try {
        handle->ReadText("latin1.txt");
        assert(false);
    } catch (const SecretParseException& e) {
        std::string msg = e.what();
        assert(msg.find("UTF-8") != std::string::npos);
        assert(msg.find("offset 3") != std::string::npos);
    }
    assert(handle->ReadBytes("latin1.txt").size() == 4);
    PrintTestResult("Text reads validate UTF-8", true);

    return true;
}

// Test 6: 포맷 지정 읽기
bool TestFormattedReads() {
    std::cout << "\n=== Test 6: Formatted Reads ===" << std::endl;

    ScratchDir scratch("accessor_format");
    Identifier id = IdentifierStore::Generate();
    const fs::path dir = DirectoryInitializer::EnsureDirectory(PathResolver::Resolve(scratch.Path(), id));
    WriteFile(dir / "db.json", R"({"user": "admin", "password": "hunter2", "port": 5432})");
    WriteFile(dir / "db.txt", R"({"user": "admin"})");
    WriteFile(dir / "broken.json", R"({"user": )");
    WriteFile(dir / "partial.json", R"({"user": "admin"})");
    WriteFile(dir / "tags.json", R"(["a", "b", "c"])");

    auto handle = SecretsAccessor::FromId(id, scratch.Path());
    assert(handle.has_value());

    SecretSource source = handle->ReadFrom("db.json");
    assert(source.Name() == "db.json");
    assert(source.ToString() == ReadFile(dir / "db.json"));
    assert(source.ToBytes().size() == ReadFile(dir / "db.json").size());
    std::ifstream reader = source.ToReader();
    assert(reader.is_open());
    PrintTestResult("Plain builder reads", true);

    nlohmann::json j = handle->ReadFrom("db.json").WithFormat(JsonFormat{}).IntoValue<nlohmann::json>();
    assert(j["user"] == "admin");
    assert(j["port"] == 5432);
    PrintTestResult("JSON into nlohmann::json", true);

    ServiceCredentials creds = handle->ReadFrom("db.json").WithFormat(JsonFormat{}).IntoValue<ServiceCredentials>();
    assert(creds.user == "admin");
    assert(creds.password == "hunter2");
    assert(creds.port == 5432);
    PrintTestResult("JSON into user type", true);

    auto tags = handle->ReadFrom("tags.json").WithFormat(JsonFormat{}).IntoValue<std::vector<std::string>>();
    assert(tags.size() == 3 && tags[2] == "c");
    PrintTestResult("JSON into standard container", true);

    try {
        handle->ReadFrom("db.txt").WithFormat(JsonFormat{}).IntoValue<nlohmann::json>();
        assert(false);
    } catch (const InvalidExtensionException& e) {
        std::string msg = e.what();
        assert(msg.find(".json") != std::string::npos);
        PrintTestResult("Wrong extension rejected", true);
    }

    try {
        handle->ReadFrom("missing.txt").WithFormat(JsonFormat{}).IntoValue<nlohmann::json>();
        assert(false);
    } catch (const InvalidExtensionException&) {
        PrintTestResult("Extension checked before file access", true);
    }

    try {
        handle->ReadFrom("missing.json").WithFormat(JsonFormat{}).IntoValue<nlohmann::json>();
        assert(false);
    } catch (const SecretNotFoundException&) {
        PrintTestResult("Missing JSON file is SecretNotFound", true);
    }

    try {
        handle->ReadFrom("broken.json").WithFormat(JsonFormat{}).IntoValue<nlohmann::json>();
        assert(false);
    } catch (const SecretParseException& e) {
        std::string msg = e.what();
        assert(msg.find("broken.json") != std::string::npos);
        PrintTestResult("Invalid JSON is a parse error", true);
    }

    try {
        handle->ReadFrom("partial.json").WithFormat(JsonFormat{}).IntoValue<ServiceCredentials>();
        assert(false);
    } catch (const SecretParseException&) {
        PrintTestResult("Missing field is a parse error", true);
    }

    return true;
}

// Test 7: optional 임시 객체에서 바로 이어 쓰기
bool TestBuilderOutlivesHandle() {
    std::cout << "\n=== Test 7: Builder Outlives Handle ===" << std::endl;

    ScratchDir scratch("accessor_chain");
    Identifier id = IdentifierStore::Generate();
    const fs::path dir = DirectoryInitializer::EnsureDirectory(PathResolver::Resolve(scratch.Path(), id));
    const std::string api_key = "sk-chain-0123456789";
    WriteFile(dir / "api_key.txt", api_key);
    WriteFile(dir / "db.json", R"({"user": "admin", "password": "hunter2", "port": 5432})");

    // FromId 가 돌려준 optional 은 이 문장 끝에서 사라진다
    SecretSource source = SecretsAccessor::FromId(id, scratch.Path())->ReadFrom("api_key.txt");
    assert(source.ToString() == api_key);
    assert(source.ToBytes().size() == api_key.size());
    PrintTestResult("SecretSource usable after optional is gone", true);

    auto formatted = SecretsAccessor::FromId(id, scratch.Path())->ReadFrom("db.json").WithFormat(JsonFormat{});
    ServiceCredentials creds = formatted.IntoValue<ServiceCredentials>();
    assert(creds.user == "admin");
    assert(creds.port == 5432);
    PrintTestResult("FormattedSecretSource usable after optional is gone", true);

    // 원래 핸들이 먼저 파괴되어도 된다
    std::optional<SecretSource> kept;
    {
        auto handle = SecretsAccessor::FromId(id, scratch.Path());
        assert(handle.has_value());
        kept.emplace(handle->ReadFrom("api_key.txt"));
    }
    assert(kept->ToString() == api_key);
    PrintTestResult("SecretSource outlives scoped handle", true);

    return true;
}

// Test 8: 빈 루트
bool TestEmptyBaseRoot() {
    std::cout << "\n=== Test 8: Empty Base Root ===" << std::endl;

    try {
        SecretsAccessor::FromId(IdentifierStore::Generate(), fs::path());
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::invalid_argument);
        PrintTestResult("Empty base root is an I/O error", true);
    }

    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Secrets Accessor Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        TestFromIdLifecycle();
        TestFromIdNotADirectory();
        TestReads();
        TestContainment();
        TestErrors();
        TestFormattedReads();
        TestBuilderOutlivesHandle();
        TestEmptyBaseRoot();

        std::cout << "\n========================================" << std::endl;
        std::cout << "  All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest failed: " << e.what() << std::endl;
        return 1;
    }
}
