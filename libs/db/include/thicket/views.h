#pragma once

#include "thicket/labels.h"
#include "thicket/record.h"

#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace thicket::db {

// Views are locale-resolved snapshots of the stored records. They copy what
// they need on construction and never refer back into the database.

class SeasonView {
public:
    SeasonView(std::string name, const labels::LabelTable& labels, const std::string& locale);

    const std::string& name() const { return name_; }
    const std::string& label() const { return label_; }

private:
    std::string name_;
    std::string label_;
};

class VariantView {
public:
    // model_preview replaces an empty variant preview.
    VariantView(std::string name, const record::VariantRecord& rec,
                const labels::LabelTable& labels, const std::string& locale,
                const std::string& model_preview);

    const std::string& name() const { return name_; }
    const std::string& label() const { return label_; }
    int index() const { return index_; }
    const std::string& preview() const { return preview_; }

    // Seasons in the order the asset lists them.
    const std::vector<SeasonView>& seasons() const { return seasons_; }

    // get_season returns the named season, or the default season when name
    // is absent or not one of this variant's seasons.
    const SeasonView& get_season(const std::optional<std::string>& name = std::nullopt) const;

private:
    std::string name_;
    std::string label_;
    int index_ = 0;
    std::vector<SeasonView> seasons_;
    SeasonView default_season_;
    std::string preview_;
};

class ModelView {
public:
    // rec must satisfy record::validate().
    ModelView(const record::ModelRecord& rec, const labels::LabelTable& labels,
              const std::string& locale);

    const std::string& name() const { return name_; }
    const std::string& label() const { return label_; }
    const std::string& md5() const { return md5_; }
    const std::string& filepath() const { return filepath_; }
    const std::string& preview() const { return preview_; }

    // Variants ordered by name.
    const std::vector<VariantView>& variants() const { return variants_; }

    // get_variant returns the named variant, or the default variant when
    // name is absent or unknown.
    const VariantView& get_variant(const std::optional<std::string>& name = std::nullopt) const;

private:
    std::string name_;
    std::string label_;
    std::string md5_;
    std::string filepath_;
    std::vector<VariantView> variants_;
    VariantView default_variant_;
    std::string preview_;
};

using ModelMap = std::map<std::string, record::ModelRecord>;

// ModelIterator walks the model table in name order and builds a fresh
// ModelView on every dereference.
class ModelIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ModelView;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = ModelView;

    ModelIterator() = default;
    ModelIterator(ModelMap::const_iterator it, const labels::LabelTable* labels,
                  const std::string* locale)
        : it_(it), labels_(labels), locale_(locale) {}

    ModelView operator*() const { return ModelView(it_->second, *labels_, *locale_); }

    ModelIterator& operator++() {
        ++it_;
        return *this;
    }
    ModelIterator operator++(int) {
        auto tmp = *this;
        ++it_;
        return tmp;
    }

    bool operator==(const ModelIterator& o) const { return it_ == o.it_; }
    bool operator!=(const ModelIterator& o) const { return it_ != o.it_; }

private:
    ModelMap::const_iterator it_;
    const labels::LabelTable* labels_ = nullptr;
    const std::string* locale_ = nullptr;
};

// ModelRange is one enumeration pass over a database. Every call to begin()
// starts again at the first name. The range is invalidated by any mutation
// of the database it came from.
class ModelRange {
public:
    ModelRange(const ModelMap& models, const labels::LabelTable& labels, const std::string& locale)
        : models_(&models), labels_(&labels), locale_(&locale) {}

    ModelIterator begin() const { return {models_->begin(), labels_, locale_}; }
    ModelIterator end() const { return {models_->end(), labels_, locale_}; }
    size_t size() const { return models_->size(); }
    bool empty() const { return models_->empty(); }

private:
    const ModelMap* models_;
    const labels::LabelTable* labels_;
    const std::string* locale_;
};

} // namespace thicket::db
