#include "thicket/labels.h"

#include <algorithm>

namespace thicket::labels {

std::string normalize_locale(std::string locale) {
    std::replace(locale.begin(), locale.end(), '_', '-');
    return locale;
}

std::string primary_subtag(const std::string& locale) {
    auto dash = locale.find('-');
    if (dash == std::string::npos) return locale;
    return locale.substr(0, dash);
}

static const std::string* find_text(const LocaleLabels& by_locale, const std::string& locale) {
    auto it = by_locale.find(locale);
    if (it == by_locale.end() || it->second.empty()) return nullptr;
    return &it->second;
}

std::string resolve(const LabelTable& table, const std::string& key,
                    const std::string& locale) {
    auto entry = table.find(key);
    if (entry == table.end()) return key;

    std::string norm = normalize_locale(locale);
    if (const auto* text = find_text(entry->second, norm)) return *text;
    if (const auto* text = find_text(entry->second, primary_subtag(norm))) return *text;
    return key;
}

void merge(LabelTable& dst, const LabelTable& src) {
    for (const auto& [key, by_locale] : src) {
        auto& target = dst[key];
        for (const auto& [locale, text] : by_locale)
            target[locale] = text;
    }
}

} // namespace thicket::labels
