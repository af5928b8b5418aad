#include "overwrite_resolver.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

namespace ftool::core {

auto to_string(OverwriteDecision decision) -> std::string_view {
    switch (decision) {
        case OverwriteDecision::Ask:             return "Ask";
        case OverwriteDecision::AlwaysOverwrite: return "AlwaysOverwrite";
        case OverwriteDecision::AlwaysSkip:      return "AlwaysSkip";
        case OverwriteDecision::Aborted:         return "Aborted";
    }
    return "unknown";
}

OverwriteResolver::OverwriteResolver(Prompt& prompt, const Options& options)
    : prompt_(prompt)
{
    if (options.force_overwrite) {
        state_ = OverwriteDecision::AlwaysOverwrite;
    } else if (options.no_clobber) {
        state_ = OverwriteDecision::AlwaysSkip;
    }
}

auto OverwriteResolver::resolve(const std::filesystem::path& target) -> ConflictAction {
    switch (state_) {
        case OverwriteDecision::AlwaysOverwrite: return ConflictAction::Overwrite;
        case OverwriteDecision::AlwaysSkip:      return ConflictAction::Skip;
        case OverwriteDecision::Aborted:         return ConflictAction::Abort;
        case OverwriteDecision::Ask:             break;
    }

    // Некорректный ответ — спрашиваем снова
    while (true) {
        const char answer = static_cast<char>(std::tolower(static_cast<unsigned char>(
            prompt_.ask(PromptKind::Overwrite, target.string()))));

        switch (answer) {
            case 'y':
            case '\n':
            case '\r':
                return ConflictAction::Overwrite;
            case 'n':
                return ConflictAction::Skip;
            case 'a':
                spdlog::debug("Overwrite all from {}", target.string());
                state_ = OverwriteDecision::AlwaysOverwrite;
                return ConflictAction::Overwrite;
            case 's':
                spdlog::debug("Skip all from {}", target.string());
                state_ = OverwriteDecision::AlwaysSkip;
                return ConflictAction::Skip;
            case 'q':
                spdlog::debug("Batch aborted at {}", target.string());
                state_ = OverwriteDecision::Aborted;
                return ConflictAction::Abort;
            default:
                continue;
        }
    }
}

auto confirm_directory_creation(Prompt& prompt, const std::filesystem::path& directory) -> bool {
    while (true) {
        const char answer = static_cast<char>(std::tolower(static_cast<unsigned char>(
            prompt.ask(PromptKind::DirectoryCreation, directory.string()))));
        switch (answer) {
            case 'y':
            case '\n':
            case '\r':
                return true;
            case 'n':
            case 'q':
                return false;
            default:
                continue;
        }
    }
}

} // namespace ftool::core
