#pragma once

#include <cstdio>
#include <iosfwd>
#include <string_view>

#include "core/overwrite/prompt.hpp"
#include "i18n/messages.hpp"

namespace ftool::cli {

/// Asks on the terminal and blocks until a line is entered. Accepts the
/// single letters and their long forms in English and Chinese.
class TerminalPrompt final : public core::Prompt {
public:
    TerminalPrompt(const i18n::MessageProvider& messages, std::istream& in, std::FILE* out = stderr);

    [[nodiscard]] auto ask(core::PromptKind kind, std::string_view context) -> char override;

    /// Maps one typed answer to the prompt alphabet: "" -> '\n', "yes"/"是" -> 'y',
    /// "all"/"全部" -> 'a', "skip"/"跳过" -> 's', "quit"/"退出" -> 'q', "no"/"否" -> 'n'.
    /// Anything else yields '?'.
    [[nodiscard]] static auto interpret(std::string_view answer) -> char;

private:
    const i18n::MessageProvider& messages_;
    std::istream& in_;
    std::FILE* out_;
};

} // namespace ftool::cli
