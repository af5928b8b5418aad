#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <functional>
#include "infra/error_handler/error.hpp"

namespace ftool::adapters::fs {

/// Filesystem metadata queries the engine branches on. Tests substitute a
/// probe to simulate other devices or a full disk.
class FsProbe {
public:
    virtual ~FsProbe() = default;

    /// Device id of the volume holding `path`, or of its nearest existing
    /// ancestor when `path` does not exist yet.
    [[nodiscard]] virtual auto device_of(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> = 0;

    /// Bytes available to an unprivileged writer at `path` (nearest existing ancestor).
    [[nodiscard]] virtual auto available_space(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> = 0;
};

class SystemFsProbe final : public FsProbe {
public:
    [[nodiscard]] auto device_of(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> override;
    [[nodiscard]] auto available_space(const std::filesystem::path& path) const
        -> infra::Result<std::uint64_t> override;
};

[[nodiscard]] auto nearest_existing_ancestor(const std::filesystem::path& path) -> std::filesystem::path;

/// Размер файла или рекурсивная сумма для каталога. Ошибки чтения
/// пропускаются, ссылки не разыменовываются.
[[nodiscard]] auto entry_size(const std::filesystem::path& path) -> std::uint64_t;

/// Last path component, ignoring a trailing separator ("dir/" -> "dir").
[[nodiscard]] auto entry_name(const std::filesystem::path& path) -> std::filesystem::path;

[[nodiscard]] auto exists_no_follow(const std::filesystem::path& path) -> bool;

/// Hidden sibling the copy is written to before it replaces the target.
[[nodiscard]] auto temporary_sibling(const std::filesystem::path& target) -> std::filesystem::path;

/// Hidden sibling an existing target is moved to while its replacement is
/// renamed into place.
[[nodiscard]] auto displaced_sibling(const std::filesystem::path& target) -> std::filesystem::path;

/// Called after every chunk with the number of bytes just written.
/// Returning false stops the copy after that chunk.
using ChunkCallback = std::function<bool(std::uint64_t)>;

/// Streams `src` into `dst` (created or truncated) in `chunk_size` pieces.
[[nodiscard]] auto copy_file_chunked(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t chunk_size,
    const ChunkCallback& on_chunk
) -> infra::VoidResult;

[[nodiscard]] auto rename_entry(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

/// Removes a file, a symlink, or a whole tree.
[[nodiscard]] auto remove_entry(const std::filesystem::path& path) -> infra::VoidResult;

/// Removes a file, a symlink, or an empty directory.
[[nodiscard]] auto remove_single(const std::filesystem::path& path) -> infra::VoidResult;

/// Mutating filesystem calls the executor makes. Tests substitute them to
/// simulate EXDEV renames or a source that cannot be removed.
class FsOps {
public:
    virtual ~FsOps() = default;

    [[nodiscard]] virtual auto copy_file(const std::filesystem::path& src,
                                         const std::filesystem::path& dst,
                                         std::size_t chunk_size,
                                         const ChunkCallback& on_chunk) -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto rename(const std::filesystem::path& src,
                                      const std::filesystem::path& dst) -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto remove(const std::filesystem::path& path) -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto remove_all(const std::filesystem::path& path) -> infra::VoidResult = 0;
};

class SystemFsOps final : public FsOps {
public:
    [[nodiscard]] auto copy_file(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 std::size_t chunk_size,
                                 const ChunkCallback& on_chunk) -> infra::VoidResult override {
        return copy_file_chunked(src, dst, chunk_size, on_chunk);
    }
    [[nodiscard]] auto rename(const std::filesystem::path& src,
                              const std::filesystem::path& dst) -> infra::VoidResult override {
        return rename_entry(src, dst);
    }
    [[nodiscard]] auto remove(const std::filesystem::path& path) -> infra::VoidResult override {
        return remove_single(path);
    }
    [[nodiscard]] auto remove_all(const std::filesystem::path& path) -> infra::VoidResult override {
        return remove_entry(path);
    }
};

} // namespace ftool::adapters::fs
