#pragma once

#include "thicket/labels.h"
#include "thicket/record.h"
#include "thicket/views.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace thicket::db {

// Current on-disk schema. Documents carrying any other version are refused.
inline constexpr int schema_version = 2;

// NotFoundError is raised by open() when the file is missing and creation
// was not requested.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// StaleSchemaError is raised by open() when info.schema_version does not
// match schema_version. There is no migration; rebuild instead.
class StaleSchemaError : public std::runtime_error {
public:
    StaleSchemaError(const std::string& path, int found, int expected);

    int found() const { return found_; }
    int expected() const { return expected_; }

private:
    int found_;
    int expected_;
};

// CorruptError is raised by open() when the file is not valid JSON or does
// not have the shape of a database document.
class CorruptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ExtractorVersion identifies the extractor release a database was built with.
struct ExtractorVersion {
    std::string version; // as reported, e.g. "1.0.38"
    int major = 0;
    int minor = 0;
    int micro = 0;
};

// parse_extractor_version splits "major.minor.micro". Missing or
// non-numeric components are left at 0.
ExtractorVersion parse_extractor_version(const std::string& text);

struct Info {
    ExtractorVersion extractor;
    int schema_version = db::schema_version;
};

// DB is the plant model database: an info block, a label table and a model
// table, persisted as one JSON document.
class DB {
public:
    // open loads the document at path. If the file does not exist it is
    // initialized and saved when create is true, otherwise NotFoundError is
    // thrown. locale selects the labels used by views ("en_US" is accepted).
    static DB open(const std::string& path, const std::string& locale = "en-US",
                   bool create = false);

    // initialize resets the document to an empty one at the current schema.
    void initialize(const ExtractorVersion& extractor = {});

    // save writes the whole document to path(), indented, non-ASCII kept as is.
    // Throws json::type_error for text that is not UTF-8 and std::runtime_error
    // for IO failures; path() is left untouched and no temp file remains.
    void save() const;

    // get_model looks the model up by name first, then by source file path.
    // Either argument may be empty.
    std::optional<ModelView> get_model(const std::string& filepath = "",
                                       const std::string& name = "") const;

    // add_model inserts or replaces the model keyed by its name and merges
    // its labels into the label table. Throws record::RecordError if the
    // record is invalid.
    void add_model(const record::ParsedModel& parsed);

    int model_count() const { return static_cast<int>(models_.size()); }

    // models enumerates the database in ascending name order. The range
    // refers into this DB and must not outlive it.
    ModelRange models() const& { return {models_, labels_, locale_}; }
    ModelRange models() const&& = delete;

    // label resolves key with the database locale, or with locale if given.
    std::string label(const std::string& key, const std::string& locale = "") const;

    const Info& info() const { return info_; }
    const std::string& path() const { return path_; }
    const std::string& locale() const { return locale_; }
    const labels::LabelTable& label_table() const { return labels_; }
    const ModelMap& model_records() const { return models_; }

    record::json to_json() const;

private:
    DB(std::string path, std::string locale);

    void load(const record::json& doc);

    std::string path_;
    std::string locale_;
    Info info_;
    labels::LabelTable labels_;
    ModelMap models_;
};

} // namespace thicket::db
