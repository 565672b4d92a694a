#pragma once

#include "thicket/labels.h"

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace thicket::record {

using json = nlohmann::ordered_json;

// VariantRecord is the persisted form of one variant of a model.
struct VariantRecord {
    int index = 0;                    // origin order within the asset, 0-based
    std::vector<std::string> seasons; // ordered, non-empty
    std::string default_season;       // member of seasons
    std::string preview;              // image path, empty if none
};

// ModelRecord is the persisted form of one catalog entry.
struct ModelRecord {
    std::string name;
    std::string filepath;        // source asset
    std::string md5;             // hex digest of the asset bytes
    std::string default_variant; // key of variants
    std::string preview;         // image path, empty if none
    std::map<std::string, VariantRecord> variants;
};

// ParsedModel is what the record parser adapter yields for one asset:
// the model record and the labels for the model, its variants and seasons.
struct ParsedModel {
    ModelRecord model;
    labels::LabelTable labels;
};

// RecordError reports a record that is structurally incomplete or violates
// the cross-field rules checked by validate().
class RecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// validate checks the invariants between the fields of a record:
// a non-empty name, a 32 digit hex md5, at least one variant, a known
// default variant, non-empty seasons and a known default season.
void validate(const ModelRecord& model);

void to_json(json& j, const VariantRecord& v);
void from_json(const json& j, VariantRecord& v);
void to_json(json& j, const ModelRecord& m);
void from_json(const json& j, ModelRecord& m);

json labels_to_json(const labels::LabelTable& table);
labels::LabelTable labels_from_json(const json& j);

// Wire blob exchanged between a parse_model worker and the build scheduler:
// {"model": <ModelRecord>, "labels": <LabelTable>}.
json to_wire(const ParsedModel& parsed);

// from_wire decodes and validates a wire blob. Throws RecordError.
ParsedModel from_wire(const json& j);

// parse_wire parses the raw text a worker printed. Throws RecordError for
// empty output, malformed JSON or an invalid record.
ParsedModel parse_wire(const std::string& text);

} // namespace thicket::record
