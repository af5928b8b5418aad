#pragma once

#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace ftool::extensions {

/// Copies modification time and permission bits from `src` to `dst`.
/// Symlinks are left alone: their own metadata cannot be set portably.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace ftool::extensions
