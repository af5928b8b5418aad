#include "messages.hpp"

#include <array>
#include <utility>

namespace ftool::i18n {

namespace {

using Entry = std::pair<std::string_view, std::string_view>;

constexpr std::array kEnglish{
    Entry{"moving", "Moving {source} → {target}"},
    Entry{"copying", "Copying {source} → {target}"},
    Entry{"renaming", "Renaming {source} → {target}"},
    Entry{"removing", "Moving {source} to trash"},
    Entry{"backing_up", "Backing up {source} → {target}"},
    Entry{"entry_prefix", "[{current}/{total}] "},
    Entry{"skipped", "Skipped: {path}"},
    Entry{"failed", "Failed: {path}: {reason}"},
    Entry{"not_started", "Not started: {path}"},
    Entry{"stopped", "Stopped: {path}"},
    Entry{"source_retained", "Copied, but the source could not be removed: {path}"},
    Entry{"dir_not_exist", "Target directory does not exist, create: {path} ? [Y/n] "},
    Entry{"creating_dirs", "Creating directories: {path}"},
    Entry{"file_exists", "File exists: {path}"},
    Entry{"overwrite_prompt", "[Y]Yes(default) [n]No [a]All [s]Skip all [q]Quit: "},
    Entry{"batch_progress", "{current}/{total} items"},
    Entry{"summary", "{succeeded} succeeded, {skipped} skipped, {failed} failed, {aborted} not done"},
    Entry{"operation_cancelled", "Operation cancelled"},
    Entry{"error_invalid_invocation", "Error: {reason}"},
};

constexpr std::array kChinese{
    Entry{"moving", "移动 {source} → {target}"},
    Entry{"copying", "复制 {source} → {target}"},
    Entry{"renaming", "重命名 {source} → {target}"},
    Entry{"removing", "将 {source} 移到回收站"},
    Entry{"backing_up", "备份 {source} → {target}"},
    Entry{"entry_prefix", "[{current}/{total}] "},
    Entry{"skipped", "已跳过: {path}"},
    Entry{"failed", "失败: {path}: {reason}"},
    Entry{"not_started", "未执行: {path}"},
    Entry{"stopped", "已中止: {path}"},
    Entry{"source_retained", "已复制，但无法删除源: {path}"},
    Entry{"dir_not_exist", "目标目录不存在，是否创建: {path} ? [Y/n] "},
    Entry{"creating_dirs", "创建目录: {path}"},
    Entry{"file_exists", "文件已存在: {path}"},
    Entry{"overwrite_prompt", "[Y]是(默认) [n]否 [a]全部 [s]跳过全部 [q]退出: "},
    Entry{"batch_progress", "{current}/{total} 项"},
    Entry{"summary", "成功 {succeeded}，跳过 {skipped}，失败 {failed}，未完成 {aborted}"},
    Entry{"operation_cancelled", "操作已取消"},
    Entry{"error_invalid_invocation", "错误：{reason}"},
};

template<std::size_t N>
auto find(const std::array<Entry, N>& table, std::string_view key) -> const std::string_view* {
    for (const auto& [k, v] : table) {
        if (k == key) return &v;
    }
    return nullptr;
}

} // namespace

auto MessageCatalog::resolve(std::string_view key, Language language) -> std::string {
    if (language == Language::Chinese) {
        if (const auto* text = find(kChinese, key)) return std::string(*text);
    }
    if (const auto* text = find(kEnglish, key)) return std::string(*text);
    return std::string(key);
}

auto MessageCatalog::resolve(std::string_view key) const -> std::string {
    return resolve(key, language_);
}

auto language_from_locale(std::string_view locale) -> Language {
    return locale.substr(0, 2) == "zh" ? Language::Chinese : Language::English;
}

auto language_from_environment(const char* lc_all, const char* lc_messages, const char* lang) -> Language {
    for (const char* value : {lc_all, lc_messages, lang}) {
        if (value && *value) {
            return language_from_locale(value);
        }
    }
    return Language::English;
}

} // namespace ftool::i18n
