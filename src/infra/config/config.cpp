#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace ftool::infra {
    void Config::merge_with(const Config& other) {
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (other.verify) verify = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.language) language = other.language;
        if (other.trash_dir) trash_dir = other.trash_dir;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".ftool.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "ftool" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "ftool" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["buffer_size"]) {
                auto size = config["buffer_size"].as<std::size_t>();
                if (size == 0) {
                    return std::unexpected(fmt::format("{}: buffer_size must be positive", path.string()));
                }
                cfg.buffer_size = size;
            }
            if (config["large_file_threshold"]) cfg.large_file_threshold = config["large_file_threshold"].as<std::uint64_t>();
            if (config["multi_entry_threshold"]) cfg.multi_entry_threshold = config["multi_entry_threshold"].as<std::size_t>();

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["preserve_metadata"]) cfg.preserve_metadata = config["preserve_metadata"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            if (config["language"]) cfg.language = config["language"].as<std::string>();
            if (config["trash_dir"]) cfg.trash_dir = config["trash_dir"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return parse_config(path);
        }

        // Файл не найден — возвращаем конфиг по умолчанию (не ошибка!)
        return Config{};
    }

    auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::unexpected(fmt::format("Config file not found: {}", path.string()));
        }
        return parse_config(path);
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.verify = args.verify;
        cfg.quiet = args.quiet;
        cfg.progress = !args.quiet;
        return cfg;
    }

} // namespace ftool::infra
