// src/common/bind/include/IdBinder.hpp
#pragma once
#include "common/identifier/include/Identifier.hpp"
#include <filesystem>
#include <string>

namespace devsecrets::bind
{
    namespace fs = std::filesystem;

    // 생성 헤더의 include guard 겸 매크로 접두사
    constexpr const char* BOUND_ID_MACRO = "DEVSECRETS_BOUND_ID_TEXT";

    /**
     * @brief 빌드 시점에 식별자를 상수로 박아 넣는 헤더 생성기
     *
     * devsecrets-bind 도구와 CMake 함수 devsecrets_bind_id() 가 사용한다.
     * 생성된 헤더를 include 한 프로그램은 실행 중에 식별자 파일을 다시 읽지 않는다.
     */
    class IdBinder
    {
    public:
        /**
         * @brief 식별자 파일 검증 후 로드
         * @throws SecretsIoException 파일이 없거나 읽을 수 없을 때
         * @throws MalformedIdentifierException 형식 오류
         */
        static identifier::Identifier LoadBoundId(const fs::path& id_file);

        /**
         * @brief 헤더 본문 생성
         *
         * 제공하는 것:
         * - DEVSECRETS_BOUND_ID_TEXT        문자열 리터럴 매크로
         * - devsecrets::bound::kIdText      constexpr const char*
         * - devsecrets::bound::Id()         identifier::Identifier (Identifier.hpp 필요)
         */
        static std::string RenderHeader(const identifier::Identifier& id, const fs::path& id_file);

        /**
         * @brief 내용이 바뀐 경우에만 기록 (불필요한 재컴파일 방지)
         * @return 실제로 기록했으면 true
         * @throws SecretsIoException 쓰기 실패 시
         */
        static bool WriteHeader(const fs::path& output, const std::string& content);

    private:
        IdBinder() = delete;
    };

} // namespace devsecrets::bind
