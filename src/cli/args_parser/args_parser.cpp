#include "args_parser.hpp"

#include <filesystem>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace ftool::args_parser {

namespace {

constexpr int kExitInvalid = 3;

struct Subcommand {
    core::Verb verb;
    const char* name;
    const char* alias;
    const char* description;
};

constexpr Subcommand kSubcommands[] = {
    {core::Verb::Move,   "move",   "mv",  "Move files or directories into a target directory"},
    {core::Verb::Copy,   "copy",   "cp",  "Copy files or directories into a target directory"},
    {core::Verb::Rename, "rename", "ren", "Rename a file or directory in place"},
    {core::Verb::Remove, "remove", "rm",  "Move files or directories to the trash"},
    {core::Verb::Backup, "backup", "bak", "Create numbered .bak copies next to the sources"},
};

auto version_string() -> std::string {
    constexpr auto git = build_info::get_git_info();
    return fmt::format("ftool {} ({}{}, built {})", git.commit_short, git.branch,
                       git.dirty ? ", dirty" : "", git.timestamp);
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLI::App app{"Unified move/copy/rename/remove/backup with auto-mkdir and progress", "ftool"};
    app.set_version_flag("--version", version_string());
    app.require_subcommand(1);

    CLIArgs args;
    std::vector<std::string> positionals;

    for (const auto& sub : kSubcommands) {
        auto* cmd = app.add_subcommand(sub.name, sub.description);
        cmd->alias(sub.alias);

        switch (sub.verb) {
            case core::Verb::Move:
            case core::Verb::Copy:
                cmd->add_option("paths", positionals, "Sources followed by the target directory")->required();
                cmd->add_flag("-p,--mkdir", args.mkdir, "Create the target directory without asking");
                break;
            case core::Verb::Rename:
                cmd->add_option("paths", positionals, "Path to rename followed by the new name")->required();
                break;
            case core::Verb::Remove:
            case core::Verb::Backup:
                cmd->add_option("sources", positionals, "Files or directories")->required();
                break;
        }
        cmd->add_flag("-f,--force", args.force, "Overwrite existing files without asking");
        cmd->add_flag("-n,--no-clobber", args.no_clobber, "Never overwrite existing files");
        cmd->add_flag("-v,--verbose", args.verbose, "Print a line per item");
        cmd->add_flag("-q,--quiet", args.quiet, "Only print errors");
        cmd->add_flag("--verify", args.verify, "Compare content hashes after copying");
        cmd->add_option("--config", args.config_file, "Read settings from this YAML file");

        cmd->callback([&args, verb = sub.verb] { args.verb = verb; });
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return std::unexpected(rc == 0 ? 0 : kExitInvalid);
    }

    if (args.force && args.no_clobber) {
        fmt::print(stderr, "Error: Cannot use --force and --no-clobber together\n");
        return std::unexpected(kExitInvalid);
    }

    switch (args.verb) {
        case core::Verb::Move:
        case core::Verb::Copy:
            if (positionals.size() < 2) {
                fmt::print(stderr, "Error: {} needs at least one source and a target directory\n",
                           core::to_string(args.verb));
                return std::unexpected(kExitInvalid);
            }
            args.destination = positionals.back();
            positionals.pop_back();
            break;
        case core::Verb::Rename:
            if (positionals.size() != 2) {
                fmt::print(stderr, "Error: rename takes a path and a new name\n");
                return std::unexpected(kExitInvalid);
            }
            args.destination = positionals.back();
            positionals.pop_back();
            break;
        case core::Verb::Remove:
        case core::Verb::Backup:
            break;
    }
    args.sources = std::move(positionals);
    return args;
}

auto to_request(const CLIArgs& args) -> core::OperationRequest {
    core::OperationRequest request;
    request.verb = args.verb;
    for (const auto& src : args.sources) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(src, ec);
        request.sources.push_back(ec ? std::filesystem::path(src) : absolute);
    }
    if (args.destination) {
        if (args.verb == core::Verb::Rename) {
            // Новое имя остаётся простым именем
            request.destination = std::filesystem::path(*args.destination);
        } else {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(*args.destination, ec);
            request.destination = ec ? std::filesystem::path(*args.destination) : absolute;
        }
    }
    request.options = core::Options{
        .auto_mkdir = args.mkdir,
        .force_overwrite = args.force,
        .no_clobber = args.no_clobber,
        .verbose = args.verbose,
    };
    return request;
}

} // namespace ftool::args_parser
