// src/cli/main.cpp
#include "Commands.hpp"
#include "Workspace.hpp"
#include "common/env/EnvManager.hpp"
#include "common/paths/include/PathResolver.hpp"
#include "common/exception/include/DevSecretsException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <iostream>
#include <string>

using namespace devsecrets;
using namespace devsecrets::cli;
using namespace devsecrets::env;

void PrintUsage(std::ostream& os, const char* program_name) {
    os << "Usage: " << program_name << " [--repo DIR] [--env-file FILE] <command>" << std::endl;
    os << std::endl;
    os << "Commands:" << std::endl;
    os << "  init             Create the identifier file and the secrets directory" << std::endl;
    os << "  path             Print the secrets directory of the repository" << std::endl;
    os << std::endl;
    os << "Options:" << std::endl;
    os << "  --repo DIR       Repository root. Default: nearest ancestor with "
       << ".devsecrets_id.txt or .git" << std::endl;
    os << "  --env-file FILE  .env file with DEVSECRETS_* settings" << std::endl;
    os << "  -h, --help       Show this help" << std::endl;
    os << std::endl;
    os << "Environment:" << std::endl;
    os << "  DEVSECRETS_ROOT       Base directory for secrets directories" << std::endl;
    os << "  DEVSECRETS_LOG_LEVEL  DEBUG, INFO, WARN, ERROR, FATAL, NONE" << std::endl;
    os << "  DEVSECRETS_LOG_FILE   Append log lines to this file" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string repo_arg;
    std::string env_file;
    std::string command;

    // 명령행 인자 파싱
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(std::cout, argv[0]);
            return 0;
        } else if (arg == "--repo" && i + 1 < argc) {
            repo_arg = argv[++i];
        } else if (arg == "--env-file" && i + 1 < argc) {
            env_file = argv[++i];
        } else if (command.empty() && !arg.empty() && arg[0] != '-') {
            command = arg;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            PrintUsage(std::cerr, argv[0]);
            return 2;
        }
    }

    if (command.empty()) {
        std::cerr << "Error: a command is required" << std::endl;
        PrintUsage(std::cerr, argv[0]);
        return 2;
    }
    if (command != "init" && command != "path") {
        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        PrintUsage(std::cerr, argv[0]);
        return 2;
    }

    // 환경 설정 로드
    if (!EnvManager::Instance().Initialize(env_file)) {
        std::cerr << "Error: failed to load environment file: "
                  << (env_file.empty() ? "(from " + std::string(KEY_ENV_FILE) + ")" : env_file) << std::endl;
        return 1;
    }

    // 로거 초기화
    std::string log_file = Config::HasKey(KEY_LOG_FILE) ? Config::GetString(KEY_LOG_FILE) : "";
    std::string log_level = Config::HasKey(KEY_LOG_LEVEL) ? Config::GetString(KEY_LOG_LEVEL) : "INFO";
    utils::Logger::Instance().Initialize(log_file.empty() ? nullptr : log_file.c_str(), true,
                                         log_level.c_str());

    try {
        const fs::path repo_root = repo_arg.empty()
            ? FindRepoRoot(fs::current_path())
            : fs::absolute(fs::path(repo_arg));
        const fs::path base_root = paths::PathResolver::ConfiguredBaseRoot();

        DEVSECRETS_LOG_DEBUGF("Main", "Repository root: %s", repo_root.c_str());
        DEVSECRETS_LOG_DEBUGF("Main", "Base root: %s", base_root.c_str());

        if (command == "init") {
            return RunInit(repo_root, base_root, std::cout);
        }
        return RunPath(repo_root, base_root, std::cout);

    } catch (const DevSecretsException& e) {
        DEVSECRETS_LOG_ERRORF("Main", "%s", e.what());
        return 1;
    } catch (const fs::filesystem_error& e) {
        DEVSECRETS_LOG_ERRORF("Main", "Filesystem error: %s", e.what());
        return 1;
    }
}
