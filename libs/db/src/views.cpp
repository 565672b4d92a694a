#include "thicket/views.h"

#include <utility>

namespace thicket::db {

SeasonView::SeasonView(std::string name, const labels::LabelTable& labels,
                       const std::string& locale)
    : name_(std::move(name)), label_(labels::resolve(labels, name_, locale)) {}

VariantView::VariantView(std::string name, const record::VariantRecord& rec,
                         const labels::LabelTable& labels, const std::string& locale,
                         const std::string& model_preview)
    : name_(std::move(name)),
      label_(labels::resolve(labels, name_, locale)),
      index_(rec.index),
      default_season_(rec.default_season, labels, locale),
      preview_(rec.preview.empty() ? model_preview : rec.preview) {
    seasons_.reserve(rec.seasons.size());
    for (const auto& s : rec.seasons) seasons_.emplace_back(s, labels, locale);
}

const SeasonView& VariantView::get_season(const std::optional<std::string>& name) const {
    if (name) {
        for (const auto& s : seasons_) {
            if (s.name() == *name) return s;
        }
    }
    return default_season_;
}

static VariantView make_default_variant(const record::ModelRecord& rec,
                                        const labels::LabelTable& labels,
                                        const std::string& locale) {
    return VariantView(rec.default_variant, rec.variants.at(rec.default_variant), labels,
                       locale, rec.preview);
}

ModelView::ModelView(const record::ModelRecord& rec, const labels::LabelTable& labels,
                     const std::string& locale)
    : name_(rec.name),
      label_(labels::resolve(labels, rec.name, locale)),
      md5_(rec.md5),
      filepath_(rec.filepath),
      default_variant_(make_default_variant(rec, labels, locale)),
      preview_(rec.preview) {
    variants_.reserve(rec.variants.size());
    for (const auto& [vname, v] : rec.variants)
        variants_.emplace_back(vname, v, labels, locale, rec.preview);
}

const VariantView& ModelView::get_variant(const std::optional<std::string>& name) const {
    if (name) {
        for (const auto& v : variants_) {
            if (v.name() == *name) return v;
        }
    }
    return default_variant_;
}

} // namespace thicket::db
