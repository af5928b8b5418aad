#pragma once

#include <string>
#include <string_view>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace ftool::i18n {

enum class Language {
    English,
    Chinese
};

/// Resolves message keys to format templates with named fields
/// ("Moving {source} → {target}"). Used only to label output.
class MessageProvider {
public:
    virtual ~MessageProvider() = default;

    [[nodiscard]] virtual auto resolve(std::string_view key) const -> std::string = 0;
};

/// Built-in tables. Unknown keys fall back to English, then to the key itself.
class MessageCatalog final : public MessageProvider {
public:
    explicit MessageCatalog(Language language = Language::English) : language_(language) {}

    [[nodiscard]] auto resolve(std::string_view key) const -> std::string override;
    [[nodiscard]] static auto resolve(std::string_view key, Language language) -> std::string;

    [[nodiscard]] auto language() const -> Language { return language_; }

private:
    Language language_;
};

/// Picks the language from a locale string such as "zh_CN.UTF-8" or "en_US";
/// anything not Chinese is English.
[[nodiscard]] auto language_from_locale(std::string_view locale) -> Language;

/// First non-empty of LC_ALL, LC_MESSAGES, LANG (values passed in by the caller).
[[nodiscard]] auto language_from_environment(const char* lc_all, const char* lc_messages, const char* lang)
    -> Language;

template<typename... Args>
[[nodiscard]] auto format(const MessageProvider& messages, std::string_view key, Args&&... args) -> std::string {
    const auto templ = messages.resolve(key);
    try {
        return fmt::format(fmt::runtime(templ), std::forward<Args>(args)...);
    } catch (const fmt::format_error& e) {
        spdlog::warn("Bad message template '{}': {}", key, e.what());
        return templ;
    }
}

} // namespace ftool::i18n
