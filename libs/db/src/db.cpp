#include "thicket/db.h"

#include "cli_logger.h"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace thicket::db {

using json = record::json;

StaleSchemaError::StaleSchemaError(const std::string& path, int found, int expected)
    : std::runtime_error("database " + path + " has schema version " + std::to_string(found) +
                         ", expected " + std::to_string(expected)),
      found_(found),
      expected_(expected) {}

ExtractorVersion parse_extractor_version(const std::string& text) {
    ExtractorVersion v;
    auto begin = text.find_first_not_of(" \t\r\n");
    auto end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos) return v;
    v.version = text.substr(begin, end - begin + 1);

    int* parts[] = {&v.major, &v.minor, &v.micro};
    std::istringstream in(v.version);
    std::string component;
    for (int* part : parts) {
        if (!std::getline(in, component, '.')) break;
        std::from_chars(component.data(), component.data() + component.size(), *part);
    }
    return v;
}

DB::DB(std::string path, std::string locale)
    : path_(std::move(path)), locale_(labels::normalize_locale(std::move(locale))) {}

DB DB::open(const std::string& path, const std::string& locale, bool create) {
    DB db(path, locale);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!create) throw NotFoundError("database not found: " + path);
        LOGI("creating database", path);
        db.initialize();
        db.save();
        return db;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("reading database " + path);

    json doc;
    try {
        doc = json::parse(f);
    } catch (const json::parse_error& e) {
        LOGE("JSON error while loading database", path + ":", e.what());
        throw CorruptError("database " + path + ": " + e.what());
    }

    db.load(doc);
    return db;
}

void DB::load(const json& doc) {
    int found = 0;
    try {
        found = doc.at("info").at("schema_version").get<int>();
    } catch (const json::exception& e) {
        LOGE("database", path_, "has no schema version:", e.what());
        throw CorruptError("database " + path_ + ": missing info.schema_version");
    }
    if (found != schema_version) {
        LOGW("unsupported database schema version", found, "in", path_,
             "(expected " + std::to_string(schema_version) + ")");
        throw StaleSchemaError(path_, found, schema_version);
    }

    Info info;
    labels::LabelTable labels;
    ModelMap models;
    try {
        const auto& i = doc.at("info");
        info.schema_version = found;
        info.extractor.version = i.value("sdk_version", "");
        info.extractor.major = i.value("sdk_major", 0);
        info.extractor.minor = i.value("sdk_minor", 0);
        info.extractor.micro = i.value("sdk_micro", 0);

        labels = record::labels_from_json(doc.at("labels"));

        const auto& m = doc.at("models");
        if (!m.is_object()) throw record::RecordError("models must be an object");
        for (const auto& [name, rec] : m.items()) {
            auto model = rec.get<record::ModelRecord>();
            record::validate(model);
            if (model.name != name)
                throw record::RecordError("model key \"" + name + "\" holds model \"" +
                                          model.name + "\"");
            models.emplace(name, std::move(model));
        }
    } catch (const json::exception& e) {
        LOGE("malformed database", path_ + ":", e.what());
        throw CorruptError("database " + path_ + ": " + e.what());
    } catch (const record::RecordError& e) {
        LOGE("malformed database", path_ + ":", e.what());
        throw CorruptError("database " + path_ + ": " + e.what());
    }

    info_ = std::move(info);
    labels_ = std::move(labels);
    models_ = std::move(models);
}

void DB::initialize(const ExtractorVersion& extractor) {
    info_ = Info{extractor, schema_version};
    labels_.clear();
    models_.clear();
}

json DB::to_json() const {
    json models = json::object();
    for (const auto& [name, rec] : models_) models[name] = rec;

    return json{
        {"info",
         {
             {"sdk_version", info_.extractor.version},
             {"sdk_major", info_.extractor.major},
             {"sdk_minor", info_.extractor.minor},
             {"sdk_micro", info_.extractor.micro},
             {"schema_version", info_.schema_version},
         }},
        {"labels", record::labels_to_json(labels_)},
        {"models", std::move(models)},
    };
}

void DB::save() const {
    // Serialize first: dump() throws on strings that are not valid UTF-8.
    const std::string text = to_json().dump(4) + '\n';

    // Write to a temp file and rename on success.
    std::string tmp_path = path_ + ".tmp";
    std::error_code ec;
    {
        std::ofstream f(tmp_path, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("writing database " + tmp_path);
        f << text;
        f.close();
        if (!f) {
            fs::remove(tmp_path, ec);
            throw std::runtime_error("writing database " + tmp_path);
        }
    }
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp_path, rm_ec);
        throw std::runtime_error("renaming " + tmp_path + " to " + path_ + ": " + ec.message());
    }
}

std::optional<ModelView> DB::get_model(const std::string& filepath,
                                       const std::string& name) const {
    if (!name.empty()) {
        auto it = models_.find(name);
        if (it != models_.end()) return ModelView(it->second, labels_, locale_);
    }

    if (!filepath.empty()) {
        for (const auto& [n, rec] : models_) {
            if (rec.filepath == filepath) return ModelView(rec, labels_, locale_);
        }
    }
    return std::nullopt;
}

void DB::add_model(const record::ParsedModel& parsed) {
    record::validate(parsed.model);
    models_[parsed.model.name] = parsed.model;
    labels::merge(labels_, parsed.labels);
}

std::string DB::label(const std::string& key, const std::string& locale) const {
    return labels::resolve(labels_, key, locale.empty() ? locale_ : locale);
}

} // namespace thicket::db
