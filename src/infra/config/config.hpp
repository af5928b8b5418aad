#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace ftool::args_parser{
    struct CLIArgs;
}

namespace ftool::infra {

inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;                 // 1 MiB
inline constexpr std::uint64_t kLargeFileThreshold = 32ull * 1024 * 1024;     // 32 MiB
inline constexpr std::size_t kMultiEntryThreshold = 5;

struct Config {
    // I/O
    std::optional<std::size_t> buffer_size;   // bytes
    std::uint64_t large_file_threshold = kLargeFileThreshold;
    std::size_t multi_entry_threshold = kMultiEntryThreshold;

    // Behavior
    bool verify = false;
    bool preserve_metadata = true;
    bool progress = true;
    bool quiet = false;

    // Environment-derived, resolved once in main
    std::optional<std::string> language;
    std::optional<std::filesystem::path> trash_dir;

    [[nodiscard]] auto chunk_size() const -> std::size_t {
        return buffer_size.value_or(kDefaultChunkSize);
    }

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.ftool.yaml
///   2. $XDG_CONFIG_HOME/ftool/config.yaml
///   3. ~/.config/ftool/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one explicit YAML file. A missing file is an error here.
[[nodiscard]] auto load_config_from(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const struct ftool::args_parser::CLIArgs& args) -> Config;

} // namespace ftool::infra
