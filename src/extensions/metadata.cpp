#include <filesystem>
#include "metadata.hpp"

namespace ftool::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    auto status = std::filesystem::symlink_status(src, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot stat", src));
    }
    if (std::filesystem::is_symlink(status)) {
        return {};
    }

    // Права
    std::filesystem::permissions(dst, status.permissions(), std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot set permissions on", dst));
    }

    // Временные метки
    auto time = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, time, ec);
    }
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot copy timestamps to", dst));
    }
    return {};
}

} // namespace ftool::extensions
