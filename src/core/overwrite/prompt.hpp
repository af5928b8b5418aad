#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ftool::core {

enum class PromptKind {
    Overwrite,
    DirectoryCreation
};

/// Synchronous question to the user. Implementations block until an answer
/// is available and return a single character; '\n' stands for an empty
/// answer and 'q' for a closed input.
class Prompt {
public:
    virtual ~Prompt() = default;

    [[nodiscard]] virtual auto ask(PromptKind kind, std::string_view context) -> char = 0;
};

/// Replays fixed answers; once exhausted it answers 'q'.
class ScriptedPrompt final : public Prompt {
public:
    explicit ScriptedPrompt(std::string answers = {});

    [[nodiscard]] auto ask(PromptKind kind, std::string_view context) -> char override;

    [[nodiscard]] auto times_asked() const -> std::size_t { return asked_.size(); }
    [[nodiscard]] auto contexts() const -> const std::vector<std::string>& { return asked_; }
    [[nodiscard]] auto kinds() const -> const std::vector<PromptKind>& { return kinds_; }

private:
    std::string answers_;
    std::size_t next_ = 0;
    std::vector<std::string> asked_;
    std::vector<PromptKind> kinds_;
};

} // namespace ftool::core
