#include "prompt.hpp"

namespace ftool::core {

ScriptedPrompt::ScriptedPrompt(std::string answers)
    : answers_(std::move(answers)) {}

auto ScriptedPrompt::ask(PromptKind kind, std::string_view context) -> char {
    asked_.emplace_back(context);
    kinds_.push_back(kind);
    if (next_ >= answers_.size()) {
        return 'q';
    }
    return answers_[next_++];
}

} // namespace ftool::core
