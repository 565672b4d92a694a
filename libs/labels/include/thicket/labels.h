#pragma once

#include <map>
#include <string>

namespace thicket::labels {

// LocaleLabels maps a locale tag ("en", "en-US") to a display string.
using LocaleLabels = std::map<std::string, std::string>;

// LabelTable maps an entity key (model, variant or season name) to its labels.
using LabelTable = std::map<std::string, LocaleLabels>;

// normalize_locale replaces underscores with hyphens ("en_US" -> "en-US").
std::string normalize_locale(std::string locale);

// primary_subtag returns the part before the first hyphen, or the whole
// string if there is none ("en-US" -> "en").
std::string primary_subtag(const std::string& locale);

// resolve returns the display string for key in locale. It tries the exact
// normalized locale, then its primary subtag, and falls back to key itself.
std::string resolve(const LabelTable& table, const std::string& key,
                    const std::string& locale);

// merge adds every (key, locale) pair of src into dst, overwriting pairs
// that already exist. Locales of dst that src does not mention are kept.
void merge(LabelTable& dst, const LabelTable& src);

} // namespace thicket::labels
