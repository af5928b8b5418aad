#include "xxhash_verifier.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace ftool::infra {

namespace {

struct StateDeleter {
    void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> Result<XXH64_hash_t>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH3_state_t, StateDeleter> state(XXH3_createState());
    if (!state || XXH3_64bits_reset(state.get()) == XXH_ERROR) {
        return std::unexpected(make_error(ErrorCode::IoError, "Failed to create XXH3 state"));
    }

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        XXH3_64bits_update(state.get(), buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    return XXH3_64bits_digest(state.get());
}

auto XXHashVerifier::verify_size(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> VoidResult
{
    std::error_code ec;
    auto src_size = std::filesystem::file_size(src, ec);
    if (ec) {
        return std::unexpected(from_error_code(ec, "Cannot read size of", src));
    }
    auto dst_size = std::filesystem::file_size(dst, ec);
    if (ec) {
        return std::unexpected(from_error_code(ec, "Cannot read size of", dst));
    }
    if (src_size != dst_size) {
        return std::unexpected(make_error(ErrorCode::VerificationFailed,
            fmt::format("Size mismatch: {} ({} bytes) vs {} ({} bytes)",
                        src.string(), src_size, dst.string(), dst_size)));
    }
    return {};
}

auto XXHashVerifier::verify_content(const std::filesystem::path& src,
                                    const std::filesystem::path& dst)
    -> VoidResult
{
    if (auto sized = verify_size(src, dst); !sized) {
        return sized;
    }

    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }

    auto dst_hash = hash_file(dst);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    if (*src_hash != *dst_hash) {
        spdlog::warn("Hash mismatch: {} (src: {:016x}) vs {} (dst: {:016x})",
                     src.string(), *src_hash,
                     dst.string(), *dst_hash);
        return std::unexpected(make_error(ErrorCode::VerificationFailed,
                                          fmt::format("Content mismatch after copying {}", src.string())));
    }

    spdlog::debug("Verified {} ({:016x})", dst.string(), *dst_hash);
    return {};
}

} // namespace ftool::infra
