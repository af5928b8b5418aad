#include <iostream>
#include <cstdlib>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/prompt/terminal_prompt.hpp"
#include "core/orchestrator/batch_orchestrator.hpp"
#include "adapters/fs.hpp"
#include "adapters/trash/trash_store.hpp"
#include "i18n/messages.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <chrono>

using ARGS = ftool::args_parser::CLIArgs;

constexpr auto load_from_cli = ftool::infra::config_from_cli;
constexpr auto load_config_file = ftool::infra::load_config_from_file;
constexpr auto args_parser = ftool::args_parser::parse_args;

constexpr int kExitInvalid = 3;

[[nodiscard]]
static auto
load_config(const ARGS& args)
-> std::expected<ftool::infra::Config, std::string> {
    if (args.config_file) {
        return ftool::infra::load_config_from(*args.config_file);
    }
    return load_config_file();
}

// Язык и корзина определяются здесь один раз, ядро окружение не читает
[[nodiscard]]
static auto
resolve_language(const ftool::infra::Config& config)
-> ftool::i18n::Language {
    if (config.language) {
        return ftool::i18n::language_from_locale(*config.language);
    }
    return ftool::i18n::language_from_environment(
        std::getenv("LC_ALL"), std::getenv("LC_MESSAGES"), std::getenv("LANG"));
}

[[nodiscard]]
static auto
resolve_trash_root(const ftool::infra::Config& config)
-> std::filesystem::path {
    if (config.trash_dir) {
        return *config.trash_dir;
    }
    return ftool::adapters::trash::default_trash_root(std::getenv("XDG_DATA_HOME"), std::getenv("HOME"))
        .value_or(std::filesystem::path{});
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        spdlog::cfg::load_env_levels(); // SPDLOG_LEVEL=debug

        ftool::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return args_opt.error(); // --help, --version или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config(args);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return kExitInvalid;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));
        if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        const ftool::i18n::MessageCatalog messages(resolve_language(config));
        ftool::adapters::trash::FreedesktopTrash trash(resolve_trash_root(config));
        ftool::adapters::fs::SystemFsProbe probe;
        ftool::adapters::fs::SystemFsOps ops;
        ftool::cli::TerminalPrompt prompt(messages, std::cin);

        const auto request = ftool::args_parser::to_request(args);

        auto start_time = std::chrono::steady_clock::now();
        ftool::core::BatchSummary summary;
        {
            ftool::infra::ProgressMonitor monitor(messages, config.progress, config.quiet);
            ftool::core::BatchOrchestrator orchestrator(config, messages, prompt, probe, ops, trash, monitor);
            summary = orchestrator.run(request);
        }
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (summary.batch_error && summary.batch_error->code == ftool::infra::ErrorCode::InvalidInvocation) {
            fmt::print(stderr, "{}\n", ftool::i18n::format(messages, "error_invalid_invocation",
                                                           fmt::arg("reason", summary.batch_error->message)));
        }

        if (!config.quiet) {
            spdlog::info("{} finished in {:.2f} s: {} succeeded, {} skipped, {} failed, {} not done",
                         ftool::core::to_string(request.verb), duration.count() / 1000.0,
                         summary.counts.succeeded, summary.counts.skipped,
                         summary.counts.failed, summary.counts.aborted);
        }
        if (summary.aborted_by_user || summary.interrupted) {
            spdlog::warn("{}", messages.resolve("operation_cancelled"));
        }

        return summary.exit_code();
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown fatal error");
        return 1;
    }
}
