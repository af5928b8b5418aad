#include "trash_store.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include "adapters/fs.hpp"

namespace ftool::adapters::trash {

namespace {

constexpr int kMaxNameAttempts = 10000;

auto unavailable(std::string_view reason, const std::filesystem::path& path) -> infra::Error {
    return infra::make_error(infra::ErrorCode::TrashUnavailable,
                             fmt::format("Trash unavailable for {}: {}", path.string(), reason));
}

auto is_unreserved(unsigned char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
}

} // namespace

auto encode_trash_path(const std::filesystem::path& path) -> std::string {
    std::string encoded;
    for (unsigned char c : path.string()) {
        if (is_unreserved(c)) {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded += fmt::format("%{:02X}", c);
        }
    }
    return encoded;
}

auto default_trash_root(const char* xdg_data_home, const char* home)
    -> std::optional<std::filesystem::path>
{
    if (xdg_data_home && *xdg_data_home) {
        return std::filesystem::path(xdg_data_home) / "Trash";
    }
    if (home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "Trash";
    }
    return std::nullopt;
}

FreedesktopTrash::FreedesktopTrash(std::filesystem::path root)
    : root_(std::move(root)) {}

auto FreedesktopTrash::reserve_slot(const std::filesystem::path& original)
    -> infra::Result<std::string>
{
    const auto base = fs::entry_name(original).string();
    const auto now = std::time(nullptr);
    const auto info_body = fmt::format("[Trash Info]\nPath={}\nDeletionDate={:%Y-%m-%dT%H:%M:%S}\n",
                                       encode_trash_path(original), fmt::localtime(now));

    for (int attempt = 1; attempt <= kMaxNameAttempts; ++attempt) {
        auto name = attempt == 1 ? base : fmt::format("{}.{}", base, attempt);
        // Осиротевший files/<name> без .trashinfo тоже занят
        if (fs::exists_no_follow(root_ / "files" / name)) continue;
        auto info_path = root_ / "info" / (name + ".trashinfo");

        int fd = ::open(info_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0) {
            if (errno == EEXIST) continue;
            return std::unexpected(unavailable(
                fmt::format("cannot write {}: {}", info_path.string(), std::strerror(errno)), original));
        }

        const char* data = info_body.data();
        std::size_t left = info_body.size();
        bool ok = true;
        while (left > 0) {
            ssize_t n = ::write(fd, data, left);
            if (n < 0) {
                if (errno == EINTR) continue;
                ok = false;
                break;
            }
            data += n;
            left -= static_cast<std::size_t>(n);
        }
        if (::close(fd) != 0) ok = false;

        if (!ok) {
            std::error_code ec;
            std::filesystem::remove(info_path, ec);
            return std::unexpected(unavailable(fmt::format("cannot write {}", info_path.string()), original));
        }
        return name;
    }
    return std::unexpected(unavailable("no free name in trash", original));
}

auto FreedesktopTrash::send(const std::filesystem::path& path) -> infra::VoidResult {
    if (root_.empty()) {
        return std::unexpected(unavailable("no trash location configured", path));
    }
    if (!fs::exists_no_follow(path)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
                                                 fmt::format("Source does not exist: {}", path.string())));
    }

    std::error_code ec;
    std::filesystem::create_directories(root_ / "files", ec);
    if (!ec) std::filesystem::create_directories(root_ / "info", ec);
    if (ec) {
        return std::unexpected(unavailable(fmt::format("cannot create {}: {}", root_.string(), ec.message()), path));
    }

    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) absolute = path;

    auto slot = reserve_slot(absolute);
    if (!slot) {
        return std::unexpected(std::move(slot.error()));
    }

    const auto info_path = root_ / "info" / (*slot + ".trashinfo");
    const auto stored = root_ / "files" / *slot;

    std::filesystem::rename(path, stored, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(info_path, cleanup_ec);
        // Корзина на другом томе: копировать и удалять здесь не будем
        if (ec == std::errc::cross_device_link) {
            return std::unexpected(unavailable("trash is on another filesystem", path));
        }
        return std::unexpected(infra::from_error_code(ec, "Cannot move to trash", path));
    }

    spdlog::debug("Trashed {} as {}", path.string(), stored.string());
    return {};
}

} // namespace ftool::adapters::trash
