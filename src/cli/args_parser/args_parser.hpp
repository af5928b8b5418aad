#pragma once

#include <string>
#include <vector>
#include <optional>
#include <expected>

#include "core/model/operation.hpp"

namespace ftool::args_parser {

struct CLIArgs
{
    core::Verb verb{core::Verb::Move};      // подкоманда: move/mv, copy/cp, rename/ren, remove/rm, backup/bak
    std::vector<std::string> sources;       // позиционные аргументы
    std::optional<std::string> destination; // последний аргумент (move/copy) или новое имя (rename)
    bool mkdir{false};                      // -p, --mkdir
    bool force{false};                      // -f, --force
    bool verbose{false};                    // -v, --verbose
    bool no_clobber{false};                 // -n, --no-clobber
    bool verify{false};                     // --verify
    bool quiet{false};                      // -q, --quiet
    std::optional<std::string> config_file; // --config=PATH
};

/// Parses command-line arguments. On --help/--version or a usage error the
/// message is already printed and the error holds the exit code to return
/// (0 for help/version, 3 for an invalid invocation).
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

/// Absolute sources, destination and options for the engine.
[[nodiscard]] auto to_request(const CLIArgs& args) -> core::OperationRequest;

} // namespace ftool::args_parser
