#pragma once

#include <filesystem>
#include <optional>
#include "infra/error_handler/error.hpp"

namespace ftool::adapters::trash {

/// Holding area for removed entries. `send` either moves the entry into the
/// store or fails; it never deletes anything permanently.
class RecoverableStore {
public:
    virtual ~RecoverableStore() = default;

    [[nodiscard]] virtual auto send(const std::filesystem::path& path) -> infra::VoidResult = 0;
};

/// Home trash in the freedesktop.org layout:
/// `<root>/files/<name>` plus `<root>/info/<name>.trashinfo`.
class FreedesktopTrash final : public RecoverableStore {
public:
    explicit FreedesktopTrash(std::filesystem::path root);

    [[nodiscard]] auto send(const std::filesystem::path& path) -> infra::VoidResult override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    // Резервирует уникальное имя, создавая .trashinfo с O_EXCL
    [[nodiscard]] auto reserve_slot(const std::filesystem::path& original)
        -> infra::Result<std::string>;

    std::filesystem::path root_;
};

/// `$XDG_DATA_HOME/Trash`, else `$HOME/.local/share/Trash`; nullopt when
/// neither variable is usable. Arguments are the raw environment values.
[[nodiscard]] auto default_trash_root(const char* xdg_data_home, const char* home)
    -> std::optional<std::filesystem::path>;

/// Percent-encodes a path for the `Path=` key of a .trashinfo file.
[[nodiscard]] auto encode_trash_path(const std::filesystem::path& path) -> std::string;

} // namespace ftool::adapters::trash
