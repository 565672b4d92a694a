#include "thicket/record.h"

#include <algorithm>
#include <cctype>

namespace thicket::record {

static bool is_hex_digest(const std::string& s) {
    return s.size() == 32 && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

void validate(const ModelRecord& model) {
    if (model.name.empty())
        throw RecordError("model record: empty name");
    if (!is_hex_digest(model.md5))
        throw RecordError("model " + model.name + ": md5 is not a 128-bit hex digest");
    if (model.variants.empty())
        throw RecordError("model " + model.name + ": no variants");
    if (!model.variants.contains(model.default_variant))
        throw RecordError("model " + model.name + ": default variant \"" +
                          model.default_variant + "\" is not a variant");

    for (const auto& [name, v] : model.variants) {
        if (v.seasons.empty())
            throw RecordError("model " + model.name + ": variant " + name + " has no seasons");
        if (std::find(v.seasons.begin(), v.seasons.end(), v.default_season) == v.seasons.end())
            throw RecordError("model " + model.name + ": variant " + name +
                              " default season \"" + v.default_season + "\" is not a season");
    }
}

void to_json(json& j, const VariantRecord& v) {
    j = json{
        {"index", v.index},
        {"seasons", v.seasons},
        {"default_season", v.default_season},
        {"preview", v.preview},
    };
}

void from_json(const json& j, VariantRecord& v) {
    j.at("index").get_to(v.index);
    j.at("seasons").get_to(v.seasons);
    j.at("default_season").get_to(v.default_season);
    j.at("preview").get_to(v.preview);
}

void to_json(json& j, const ModelRecord& m) {
    json variants = json::object();
    for (const auto& [name, v] : m.variants) variants[name] = v;

    j = json{
        {"name", m.name},
        {"filepath", m.filepath},
        {"md5", m.md5},
        {"default_variant", m.default_variant},
        {"preview", m.preview},
        {"variants", std::move(variants)},
    };
}

void from_json(const json& j, ModelRecord& m) {
    j.at("name").get_to(m.name);
    j.at("filepath").get_to(m.filepath);
    j.at("md5").get_to(m.md5);
    j.at("default_variant").get_to(m.default_variant);
    j.at("preview").get_to(m.preview);

    m.variants.clear();
    const auto& variants = j.at("variants");
    if (!variants.is_object())
        throw RecordError("model " + m.name + ": variants must be an object");
    for (const auto& [name, v] : variants.items())
        m.variants.emplace(name, v.get<VariantRecord>());
}

json labels_to_json(const labels::LabelTable& table) {
    json j = json::object();
    for (const auto& [key, by_locale] : table) {
        json entry = json::object();
        for (const auto& [locale, text] : by_locale) entry[locale] = text;
        j[key] = std::move(entry);
    }
    return j;
}

labels::LabelTable labels_from_json(const json& j) {
    if (!j.is_object())
        throw RecordError("labels must be an object");

    labels::LabelTable table;
    for (const auto& [key, by_locale] : j.items()) {
        if (!by_locale.is_object())
            throw RecordError("labels of " + key + " must be an object");
        auto& entry = table[key];
        for (const auto& [locale, text] : by_locale.items())
            entry[locale] = text.get<std::string>();
    }
    return table;
}

json to_wire(const ParsedModel& parsed) {
    return json{
        {"model", parsed.model},
        {"labels", labels_to_json(parsed.labels)},
    };
}

ParsedModel from_wire(const json& j) {
    ParsedModel parsed;
    try {
        if (!j.is_object()) throw RecordError("wire blob is not a JSON object");
        j.at("model").get_to(parsed.model);
        parsed.labels = labels_from_json(j.at("labels"));
    } catch (const json::exception& e) {
        throw RecordError(std::string("wire blob: ") + e.what());
    }
    validate(parsed.model);
    return parsed;
}

ParsedModel parse_wire(const std::string& text) {
    if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; }))
        throw RecordError("wire blob: empty output");

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw RecordError(std::string("wire blob: ") + e.what());
    }
    return from_wire(j);
}

} // namespace thicket::record
