#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include "infra/error_handler/error.hpp"
#include <xxhash.h>

namespace ftool::infra {

class XXHashVerifier {
public:
    // Вычисляет XXH3-64 для файла
    static auto hash_file(const std::filesystem::path& path)
        -> Result<XXH64_hash_t>;

    /// Size match between the source and the freshly written copy. Always
    /// run before a copy is reported as done or a moved source is removed.
    static auto verify_size(const std::filesystem::path& src,
                            const std::filesystem::path& dst)
        -> VoidResult;

    /// Size match plus content hash equality (`--verify`).
    static auto verify_content(const std::filesystem::path& src,
                               const std::filesystem::path& dst)
        -> VoidResult;

private:
    static constexpr std::size_t BUFFER_SIZE = 1024 * 1024;
};

} // namespace ftool::infra
