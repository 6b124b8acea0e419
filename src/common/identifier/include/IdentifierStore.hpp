// src/common/identifier/include/IdentifierStore.hpp
#pragma once
#include "Identifier.hpp"
#include <filesystem>
#include <optional>

namespace devsecrets::identifier
{
    namespace fs = std::filesystem;

    // 저장소 루트에 커밋되는 식별자 파일 이름
    constexpr const char* IDENTIFIER_FILE_NAME = ".devsecrets_id.txt";

    struct EnsuredIdentifier
    {
        Identifier id;
        bool created;  // 이번 호출에서 파일을 새로 만들었는지
    };

    /**
     * @brief 저장소 안의 식별자 파일 읽기/쓰기
     *
     * 파일은 한 번 만들어지면 다시 쓰지 않는다.
     */
    class IdentifierStore
    {
    public:
        /**
         * @brief 암호학적으로 안전한 난수(OpenSSL RAND_bytes)로 새 식별자 생성
         * @throws DevSecretsException 난수 생성 실패 시
         */
        static Identifier Generate();

        /**
         * @brief 식별자 파일 파싱
         * @throws SecretsIoException 파일이 없거나 읽을 수 없을 때
         * @throws MalformedIdentifierException 내용이 형식에 맞지 않을 때
         */
        static Identifier Read(const fs::path& path);

        /**
         * @brief Read 와 같지만 파일이 없으면 std::nullopt
         */
        static std::optional<Identifier> TryRead(const fs::path& path);

        /**
         * @brief 파일이 없을 때만 생성
         * @return 새로 만들었으면 true, 이미 있었으면 false (기존 파일은 건드리지 않음)
         * @throws SecretsIoException 쓰기 실패 시
         *
         * 임시 파일에 다 쓴 뒤 link(2) 로 제자리에 올린다.
         * 다른 프로세스는 반쯤 쓰인 파일을 볼 수 없고, 경쟁 시 한 쪽만 성공한다.
         */
        static bool WriteIfAbsent(const fs::path& path, const Identifier& id);

        /**
         * @brief O_CREAT|O_EXCL 로 직접 생성
         *
         * 하드 링크를 지원하지 않는 파일 시스템에서 WriteIfAbsent 가 사용한다.
         * 존재 여부 판정은 원자적이지만 쓰는 도중의 내용이 보일 수 있다.
         * @return 새로 만들었으면 true, 이미 있었으면 false
         * @throws SecretsIoException 생성/쓰기 실패 시 (실패한 파일은 지운다)
         */
        static bool CreateExclusive(const fs::path& path, const Identifier& id);

        /**
         * @brief 읽거나, 없으면 생성 후 기록
         *
         * 경쟁에서 지면 이긴 쪽의 파일을 다시 읽어 같은 식별자로 수렴한다.
         */
        static EnsuredIdentifier Ensure(const fs::path& path);

    private:
        IdentifierStore() = delete;
    };

} // namespace devsecrets::identifier
