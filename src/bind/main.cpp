// src/bind/main.cpp
#include "common/bind/include/IdBinder.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <iostream>
#include <string>

using namespace devsecrets;
using namespace devsecrets::bind;

void PrintUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " --id-file FILE --output HEADER" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --id-file FILE   Identifier file to embed (e.g. .devsecrets_id.txt)" << std::endl;
    std::cerr << "  --output HEADER  Generated header path" << std::endl;
}

int main(int argc, char* argv[]) {
    // 빌드 출력이 지저분해지지 않도록 경고 이상만
    utils::Logger::Instance().Initialize(nullptr, true, "WARN");

    std::string id_file;
    std::string output;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--id-file" && i + 1 < argc) {
            id_file = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else {
            std::cerr << "devsecrets-bind: error: unexpected argument '" << arg << "'" << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (id_file.empty() || output.empty()) {
        std::cerr << "devsecrets-bind: error: --id-file and --output are required" << std::endl;
        PrintUsage(argv[0]);
        return 2;
    }

    try {
        identifier::Identifier id = IdBinder::LoadBoundId(id_file);
        IdBinder::WriteHeader(output, IdBinder::RenderHeader(id, id_file));
    } catch (const MalformedIdentifierException& e) {
        // 컴파일러 진단과 같은 "파일: error: 내용" 형식
        std::cerr << id_file << ": error: malformed devsecrets identifier: " << e.Detail() << std::endl;
        return 1;
    } catch (const DevSecretsException& e) {
        std::cerr << id_file << ": error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
