#include "fs.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace ftool::adapters::fs {

namespace {

class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() {
        if (fd_ >= 0) ::close(fd_);
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    // close() на записываемом файле может вернуть отложенную ошибку (NFS, ENOSPC)
    [[nodiscard]] int release_and_close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

auto errno_error(std::string_view action, const std::filesystem::path& path) -> infra::Error {
    return infra::from_error_code(std::error_code(errno, std::generic_category()), action, path);
}

auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

} // namespace

auto nearest_existing_ancestor(const std::filesystem::path& path) -> std::filesystem::path {
    std::error_code ec;
    auto current = path;
    while (!current.empty() && !std::filesystem::exists(current, ec)) {
        auto parent = current.parent_path();
        if (parent == current) break;
        current = parent;
    }
    return current.empty() ? std::filesystem::current_path(ec) : current;
}

auto SystemFsProbe::device_of(const std::filesystem::path& path) const
    -> infra::Result<std::uint64_t>
{
    struct stat sb;
    // Сама ссылка переносится rename(2), поэтому lstat для существующего пути
    if (::lstat(path.c_str(), &sb) == 0) {
        return static_cast<std::uint64_t>(sb.st_dev);
    }
    auto anchor = nearest_existing_ancestor(path);
    if (::stat(anchor.c_str(), &sb) != 0) {
        return std::unexpected(errno_error("Cannot stat", anchor));
    }
    return static_cast<std::uint64_t>(sb.st_dev);
}

auto SystemFsProbe::available_space(const std::filesystem::path& path) const
    -> infra::Result<std::uint64_t>
{
    std::error_code ec;
    auto anchor = nearest_existing_ancestor(path);
    auto info = std::filesystem::space(anchor, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot query free space of", anchor));
    }
    return static_cast<std::uint64_t>(info.available);
}

auto entry_size(const std::filesystem::path& path) -> std::uint64_t {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (ec) return 0;

    if (std::filesystem::is_regular_file(status)) {
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : static_cast<std::uint64_t>(size);
    }
    if (!std::filesystem::is_directory(status)) {
        return 0;
    }

    std::uint64_t total = 0;
    std::filesystem::recursive_directory_iterator it(
        path, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", path.string(), ec.message());
        return 0;
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Failed to scan below {}: {}", path.string(), ec.message());
            break;
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (!entry_ec) total += size;
        }
    }
    return total;
}

auto entry_name(const std::filesystem::path& path) -> std::filesystem::path {
    auto normal = path.lexically_normal();
    if (normal.has_filename()) {
        return normal.filename();
    }
    return normal.parent_path().filename();
}

auto exists_no_follow(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

auto temporary_sibling(const std::filesystem::path& target) -> std::filesystem::path {
    return target.parent_path() / fmt::format(".{}.ftool-part", target.filename().string());
}

auto displaced_sibling(const std::filesystem::path& target) -> std::filesystem::path {
    return target.parent_path() / fmt::format(".{}.ftool-old", target.filename().string());
}

auto copy_file_chunked(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t chunk_size,
    const ChunkCallback& on_chunk
) -> infra::VoidResult {
    UniqueFd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in.valid()) {
        return std::unexpected(errno_error("Cannot open source", src));
    }

    struct stat sb;
    if (::fstat(in.get(), &sb) == -1) {
        return std::unexpected(errno_error("Cannot stat", src));
    }

    UniqueFd out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, sb.st_mode & 0777));
    if (!out.valid()) {
        return std::unexpected(errno_error("Cannot create", dst));
    }

    std::vector<char> buffer(chunk_size);
    while (true) {
        ssize_t bytes_read = ::read(in.get(), buffer.data(), buffer.size());
        if (bytes_read < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_error("Read failed on", src));
        }
        if (bytes_read == 0) break;

        if (!write_all(out.get(), buffer.data(), static_cast<std::size_t>(bytes_read))) {
            return std::unexpected(errno_error("Write failed on", dst));
        }
        if (on_chunk && !on_chunk(static_cast<std::uint64_t>(bytes_read))) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                                     fmt::format("Copy of {} interrupted", src.string())));
        }
    }

    if (out.release_and_close() != 0) {
        return std::unexpected(errno_error("Cannot finish writing", dst));
    }
    return {};
}

auto rename_entry(const std::filesystem::path& src, const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot rename", src));
    }
    return {};
}

auto remove_entry(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot remove", path));
    }
    return {};
}

auto remove_single(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot remove", path));
    }
    return {};
}

} // namespace ftool::adapters::fs
