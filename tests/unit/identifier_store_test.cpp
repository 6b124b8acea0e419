// tests/unit/identifier_store_test.cpp
#include "common/identifier/include/IdentifierStore.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/TestHelpers.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace devsecrets;
using namespace devsecrets::identifier;
using namespace devsecrets::test;

// Test 1: 파일 없음
bool TestMissingFile() {
    std::cout << "\n=== Test 1: Missing File ===" << std::endl;

    ScratchDir scratch("store_missing");
    const fs::path id_file = scratch / IDENTIFIER_FILE_NAME;

    assert(!IdentifierStore::TryRead(id_file).has_value());
    PrintTestResult("TryRead returns nullopt", true);

    try {
        IdentifierStore::Read(id_file);
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::no_such_file_or_directory);
        assert(e.Path() == id_file);
        PrintTestResult("Read throws SecretsIoException(ENOENT)", true);
    }

    return true;
}

// Test 2: 쓰기 및 읽기
bool TestWriteAndRead() {
    std::cout << "\n=== Test 2: Write And Read ===" << std::endl;

    ScratchDir scratch("store_write");
    const fs::path id_file = scratch / IDENTIFIER_FILE_NAME;

    Identifier id = IdentifierStore::Generate();
    assert(IdentifierStore::WriteIfAbsent(id_file, id));
    PrintTestResult("WriteIfAbsent creates file", true);

    assert(ReadFile(id_file) == id.Text());
    PrintTestResult("File holds exactly the identifier text", true);

    assert(IdentifierStore::Read(id_file) == id);
    PrintTestResult("Read returns written identifier", true);

    // 임시 파일이 남지 않아야 함
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(scratch.Path())) {
        (void)entry;
        ++entries;
    }
    assert(entries == 1);
    PrintTestResult("No temporary files left behind", true);

#ifdef __linux__
    auto perms = fs::status(id_file).permissions();
    assert((perms & fs::perms::owner_read) != fs::perms::none);
    assert((perms & fs::perms::others_read) != fs::perms::none);
    PrintTestResult("Identifier file is world-readable (0644)", true);
#endif

    return true;
}

// Test 3: 기존 파일 보존
bool TestNoOverwrite() {
    std::cout << "\n=== Test 3: No Overwrite ===" << std::endl;

    ScratchDir scratch("store_nooverwrite");
    const fs::path id_file = scratch / IDENTIFIER_FILE_NAME;

    Identifier first = IdentifierStore::Generate();
    Identifier second = IdentifierStore::Generate();
    assert(first != second);

    assert(IdentifierStore::WriteIfAbsent(id_file, first));
    assert(!IdentifierStore::WriteIfAbsent(id_file, second));
    assert(IdentifierStore::Read(id_file) == first);
    PrintTestResult("Second WriteIfAbsent is a no-op", true);

    // 손상된 파일도 덮어쓰지 않는다
    const fs::path broken = scratch / "broken.txt";
    WriteFile(broken, "garbage");
    assert(!IdentifierStore::WriteIfAbsent(broken, first));
    assert(ReadFile(broken) == "garbage");
    PrintTestResult("Existing malformed file untouched", true);

    return true;
}

// Test 4: Ensure
bool TestEnsure() {
    std::cout << "\n=== Test 4: Ensure ===" << std::endl;

    ScratchDir scratch("store_ensure");
    const fs::path id_file = scratch / IDENTIFIER_FILE_NAME;

    EnsuredIdentifier first = IdentifierStore::Ensure(id_file);
    assert(first.created);

    EnsuredIdentifier second = IdentifierStore::Ensure(id_file);
    assert(!second.created);
    assert(second.id == first.id);
    PrintTestResult("Ensure creates once then reads", true);

    // 손으로 쓴 파일 (줄바꿈, 대문자)
    const fs::path manual = scratch / "manual.txt";
    WriteFile(manual, "7A22AC2B-7008-40C4-A199-2896693F6D06\n");
    EnsuredIdentifier read_back = IdentifierStore::Ensure(manual);
    assert(!read_back.created);
    assert(read_back.id.Text() == "7a22ac2b-7008-40c4-a199-2896693f6d06");
    assert(ReadFile(manual) == "7A22AC2B-7008-40C4-A199-2896693F6D06\n");
    PrintTestResult("Ensure does not rewrite hand-edited file", true);

    return true;
}

// Test 5: 형식 오류
bool TestMalformed() {
    std::cout << "\n=== Test 5: Malformed Files ===" << std::endl;

    ScratchDir scratch("store_malformed");

    const std::vector<std::string> bad_contents = {
        "",
        "hello",
        "7a22ac2b-7008-40c4-a199-2896693f6d06\n7a22ac2b-7008-40c4-a199-2896693f6d06",
        "7a22ac2b7008-40c4-a199-2896693f6d06x",
        std::string(4096, 'a'),
    };

    int index = 0;
    for (const auto& content : bad_contents) {
        const fs::path file = scratch / ("bad_" + std::to_string(index++) + ".txt");
        WriteFile(file, content);

        try {
            IdentifierStore::Read(file);
            assert(false);
        } catch (const MalformedIdentifierException& e) {
            std::string msg = e.what();
            assert(msg.find(file.string()) != std::string::npos);
        }

        try {
            IdentifierStore::Ensure(file);
            assert(false);
        } catch (const MalformedIdentifierException&) {
        }
        assert(ReadFile(file) == content);
    }
    PrintTestResult("Read and Ensure reject malformed content", true);

    try {
        IdentifierStore::Read(fs::path(DEVSECRETS_TEST_DATA_DIR) / "malformed_id.txt");
        assert(false);
    } catch (const MalformedIdentifierException&) {
        PrintTestResult("Checked-in malformed fixture rejected", true);
    }

    // 디렉토리 자리
    const fs::path dir_in_place = scratch / "dir_id";
    fs::create_directories(dir_in_place);
    try {
        IdentifierStore::TryRead(dir_in_place);
        assert(false);
    } catch (const SecretsIoException&) {
        PrintTestResult("Directory in place of identifier file", true);
    }

    return true;
}

// Test 6: 동시 생성
bool TestConcurrentEnsure() {
    std::cout << "\n=== Test 6: Concurrent Ensure ===" << std::endl;

    const int NUM_ROUNDS = 20;
    const int NUM_THREADS = 8;

    for (int round = 0; round < NUM_ROUNDS; ++round) {
        ScratchDir scratch("store_race_" + std::to_string(round));
        const fs::path id_file = scratch / IDENTIFIER_FILE_NAME;

        std::vector<std::string> results(NUM_THREADS);
        std::atomic<int> created_count{0};
        std::atomic<int> error_count{0};
        std::atomic<bool> go{false};
        std::vector<std::thread> threads;

        for (int i = 0; i < NUM_THREADS; ++i) {
            threads.emplace_back([&, i]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                try {
                    EnsuredIdentifier ensured = IdentifierStore::Ensure(id_file);
                    results[i] = ensured.id.Text();
                    if (ensured.created) {
                        created_count++;
                    }
                } catch (const std::exception& e) {
                    std::cerr << "Ensure failed: " << e.what() << std::endl;
                    error_count++;
                }
            });
        }

        go.store(true);
        for (auto& t : threads) {
            t.join();
        }

        assert(error_count.load() == 0);
        assert(created_count.load() == 1);
        std::set<std::string> distinct(results.begin(), results.end());
        assert(distinct.size() == 1);
        assert(*distinct.begin() == ReadFile(id_file));
    }
    PrintTestResult("Racing writers converge on one identifier (" +
                    std::to_string(NUM_ROUNDS) + " rounds)", true);

    return true;
}

// Test 7: 하드 링크 없는 파일 시스템용 생성 경로
bool TestCreateExclusive() {
    std::cout << "\n=== Test 7: CreateExclusive ===" << std::endl;

    ScratchDir scratch("store_exclusive");
    const fs::path id_file = scratch / IDENTIFIER_FILE_NAME;

    Identifier first = IdentifierStore::Generate();
    Identifier second = IdentifierStore::Generate();

    assert(IdentifierStore::CreateExclusive(id_file, first));
    assert(ReadFile(id_file) == first.Text());
    assert(IdentifierStore::Read(id_file) == first);
    PrintTestResult("Creates file with identifier text", true);

    assert(!IdentifierStore::CreateExclusive(id_file, second));
    assert(IdentifierStore::Read(id_file) == first);
    PrintTestResult("Existing file is not replaced", true);

    try {
        IdentifierStore::CreateExclusive(scratch / "no_such_dir" / IDENTIFIER_FILE_NAME, first);
        assert(false);
    } catch (const SecretsIoException& e) {
        assert(e.Code() == std::errc::no_such_file_or_directory);
        PrintTestResult("Missing parent directory reported", true);
    }
    assert(!fs::exists(scratch / "no_such_dir"));

    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Identifier Store Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        TestMissingFile();
        TestWriteAndRead();
        TestNoOverwrite();
        TestEnsure();
        TestMalformed();
        TestConcurrentEnsure();
        TestCreateExclusive();

        std::cout << "\n========================================" << std::endl;
        std::cout << "  All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest failed: " << e.what() << std::endl;
        return 1;
    }
}
