#include "terminal_prompt.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <istream>
#include <string>
#include <utility>
#include <fmt/core.h>

namespace ftool::cli {

namespace {

constexpr std::array<std::pair<std::string_view, char>, 15> kAnswers{{
    {"y", 'y'}, {"yes", 'y'}, {"是", 'y'},
    {"n", 'n'}, {"no", 'n'}, {"否", 'n'},
    {"a", 'a'}, {"all", 'a'}, {"全部", 'a'},
    {"s", 's'}, {"skip", 's'}, {"跳过", 's'},
    {"q", 'q'}, {"quit", 'q'}, {"退出", 'q'},
}};

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

} // namespace

TerminalPrompt::TerminalPrompt(const i18n::MessageProvider& messages, std::istream& in, std::FILE* out)
    : messages_(messages), in_(in), out_(out) {}

auto TerminalPrompt::interpret(std::string_view answer) -> char {
    auto trimmed = trim(answer);
    if (trimmed.empty()) {
        return '\n';
    }
    std::string lowered(trimmed);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [word, letter] : kAnswers) {
        if (lowered == word) return letter;
    }
    return '?';
}

auto TerminalPrompt::ask(core::PromptKind kind, std::string_view context) -> char {
    // Сначала стираем строку прогресса, если она есть
    fmt::print(out_, "\r\033[K");
    switch (kind) {
        case core::PromptKind::Overwrite:
            fmt::print(out_, "{}\n", i18n::format(messages_, "file_exists", fmt::arg("path", context)));
            fmt::print(out_, "{}", messages_.resolve("overwrite_prompt"));
            break;
        case core::PromptKind::DirectoryCreation:
            fmt::print(out_, "{}", i18n::format(messages_, "dir_not_exist", fmt::arg("path", context)));
            break;
    }
    std::fflush(out_);

    std::string line;
    if (!std::getline(in_, line)) {
        fmt::print(out_, "\n{}\n", messages_.resolve("operation_cancelled"));
        return 'q';
    }
    return interpret(line);
}

} // namespace ftool::cli
