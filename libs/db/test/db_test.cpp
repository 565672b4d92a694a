#include "thicket/db.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace thicket;
using thicket::db::DB;

namespace {

namespace fs = std::filesystem;

fs::path unique_test_root() {
    static int counter = 0;
    const auto base = fs::temp_directory_path() / "thicket-db-tests";
    const auto unique = base / (std::to_string(getpid()) + "-" + std::to_string(counter++));
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

void write_text_file(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << text;
}

std::string read_text_file(const fs::path& path) {
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

record::ParsedModel make_model(const std::string& name, const std::string& filepath) {
    record::ParsedModel p;
    p.model.name = name;
    p.model.filepath = filepath;
    p.model.md5 = "d41d8cd98f00b204e9800998ecf8427e";
    p.model.default_variant = name + " adult";
    p.model.preview = "/previews/" + name + ".png";
    p.model.variants[name + " young"] = {1, {"Spring", "Summer"}, "Spring",
                                         "/previews/" + name + "_young.png"};
    p.model.variants[name + " adult"] = {0, {"Spring", "Summer", "Winter"}, "Summer", ""};
    p.labels[name] = {{"en", name + " tree"}, {"de", name + " Baum"}};
    p.labels["Summer"] = {{"en", "Summer"}, {"de", "Sommer"}};
    return p;
}

} // namespace

TEST(Db, OpenMissingWithoutCreateThrowsNotFound) {
    auto root = unique_test_root();
    EXPECT_THROW(DB::open((root / "missing.json").string()), db::NotFoundError);
    EXPECT_FALSE(fs::exists(root / "missing.json"));
}

TEST(Db, OpenMissingWithCreateWritesEmptyDocument) {
    auto root = unique_test_root();
    auto path = (root / "plants.json").string();

    auto d = DB::open(path, "en-US", true);
    EXPECT_EQ(d.model_count(), 0);
    EXPECT_EQ(d.info().schema_version, db::schema_version);
    ASSERT_TRUE(fs::exists(path));

    auto doc = record::json::parse(read_text_file(path));
    EXPECT_EQ(doc["info"]["schema_version"], db::schema_version);
    EXPECT_TRUE(doc["labels"].empty());
    EXPECT_TRUE(doc["models"].empty());

    EXPECT_NO_THROW(DB::open(path));
}

TEST(Db, OlderSchemaIsStale) {
    auto root = unique_test_root();
    auto path = root / "old.json";
    write_text_file(path, R"({"info": {"schema_version": 1}, "labels": {}, "models": {}})");

    try {
        DB::open(path.string());
        FAIL() << "expected StaleSchemaError";
    } catch (const db::StaleSchemaError& e) {
        EXPECT_EQ(e.found(), 1);
        EXPECT_EQ(e.expected(), db::schema_version);
    }
}

TEST(Db, StaleCheckIgnoresOtherwiseValidContent) {
    auto root = unique_test_root();
    auto path = (root / "plants.json").string();
    auto d = DB::open(path, "en", true);
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));
    d.save();

    auto doc = record::json::parse(read_text_file(path));
    doc["info"]["schema_version"] = db::schema_version - 1;
    write_text_file(path, doc.dump());
    EXPECT_THROW(DB::open(path), db::StaleSchemaError);

    doc["info"]["schema_version"] = db::schema_version + 1;
    write_text_file(path, doc.dump());
    EXPECT_THROW(DB::open(path), db::StaleSchemaError);
}

TEST(Db, MalformedJsonIsCorrupt) {
    auto root = unique_test_root();
    auto path = root / "broken.json";
    write_text_file(path, "{ \"info\": { \"schema_version\": 2 ");
    EXPECT_THROW(DB::open(path.string()), db::CorruptError);
}

TEST(Db, WrongShapeIsCorrupt) {
    auto root = unique_test_root();
    auto path = root / "shape.json";

    write_text_file(path, R"({"labels": {}, "models": {}})");
    EXPECT_THROW(DB::open(path.string()), db::CorruptError);

    write_text_file(path, R"({"info": {"schema_version": 2}, "labels": [], "models": {}})");
    EXPECT_THROW(DB::open(path.string()), db::CorruptError);

    write_text_file(path, R"({"info": {"schema_version": 2}, "labels": {},
        "models": {"Acer": {"name": "Acer"}}})");
    EXPECT_THROW(DB::open(path.string()), db::CorruptError);
}

TEST(Db, KeyNameMismatchIsCorrupt) {
    auto root = unique_test_root();
    auto path = root / "plants.json";
    {
        auto d = DB::open(path.string(), "en", true);
        d.add_model(make_model("Zelkova", "/a/Zelkova.lbw.gz"));
        d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));
        d.save();
    }

    // Same records, filed under keys that are not their names.
    auto doc = record::json::parse(read_text_file(path));
    record::json models = record::json::object();
    models["A"] = doc["models"]["Zelkova"];
    models["B"] = doc["models"]["Acer"];
    doc["models"] = std::move(models);
    write_text_file(path, doc.dump());

    EXPECT_THROW(DB::open(path.string()), db::CorruptError);
}

TEST(Db, FailedSaveLeavesNoTempFile) {
    auto root = unique_test_root();
    auto path = root / "plants.json";
    auto d = DB::open(path.string(), "en", true);
    const auto before = read_text_file(path);

    // Not valid UTF-8, so serialization fails before anything is written.
    d.add_model(make_model("Acer", "/a/\xff\xfe.lbw.gz"));
    EXPECT_THROW(d.save(), record::json::type_error);
    EXPECT_FALSE(fs::exists(root / "plants.json.tmp"));
    EXPECT_EQ(read_text_file(path), before);

    // The rename fails when the target is a non-empty directory.
    auto blocked = root / "blocked.json";
    auto b = DB::open(blocked.string(), "en", true);
    fs::remove(blocked);
    fs::create_directories(blocked / "inside");
    EXPECT_THROW(b.save(), std::runtime_error);
    EXPECT_FALSE(fs::exists(root / "blocked.json.tmp"));
}

TEST(Db, SaveThenOpenRoundTrips) {
    auto root = unique_test_root();
    auto path = (root / "plants.json").string();

    auto d = DB::open(path, "en-US", true);
    d.initialize(db::parse_extractor_version("1.0.38\n"));
    d.add_model(make_model("Betula", "/a/Betula.lbw.gz"));
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));
    auto with_unicode = make_model("Cornus", "/a/Cornus.lbw.gz");
    with_unicode.labels["Cornus"]["ja"] = "ミズキ";
    d.add_model(with_unicode);
    d.save();

    auto text = read_text_file(path);
    EXPECT_NE(text.find("ミズキ"), std::string::npos);

    auto loaded = DB::open(path);
    EXPECT_EQ(loaded.to_json(), d.to_json());
    EXPECT_EQ(loaded.info().extractor.version, "1.0.38");
    EXPECT_EQ(loaded.info().extractor.major, 1);
    EXPECT_EQ(loaded.info().extractor.minor, 0);
    EXPECT_EQ(loaded.info().extractor.micro, 38);
    EXPECT_EQ(loaded.label_table(), d.label_table());
    EXPECT_EQ(loaded.model_count(), 3);
    EXPECT_EQ(loaded.model_records().at("Acer").variants.at("Acer young").seasons,
              (std::vector<std::string>{"Spring", "Summer"}));
}

TEST(Db, GetModelByNameThenFilepath) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "de-DE", true);
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));
    d.add_model(make_model("Betula", "/a/Betula.lbw.gz"));

    auto by_name = d.get_model("", "Betula");
    ASSERT_TRUE(by_name.has_value());
    EXPECT_EQ(by_name->name(), "Betula");
    EXPECT_EQ(by_name->label(), "Betula Baum");

    auto by_path = d.get_model("/a/Acer.lbw.gz");
    ASSERT_TRUE(by_path.has_value());
    EXPECT_EQ(by_path->name(), "Acer");

    auto name_missing = d.get_model("/a/Acer.lbw.gz", "Quercus");
    ASSERT_TRUE(name_missing.has_value());
    EXPECT_EQ(name_missing->name(), "Acer");

    EXPECT_FALSE(d.get_model("/a/Quercus.lbw.gz").has_value());
    EXPECT_FALSE(d.get_model("", "Quercus").has_value());
    EXPECT_FALSE(d.get_model().has_value());
}

TEST(Db, AddModelReplacesAndMergesLabels) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "en", true);
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));

    auto again = make_model("Acer", "/b/Acer.lbw.gz");
    again.labels["Acer"] = {{"en", "Maple"}, {"fr", "Erable"}};
    d.add_model(again);

    EXPECT_EQ(d.model_count(), 1);
    EXPECT_EQ(d.model_records().at("Acer").filepath, "/b/Acer.lbw.gz");
    const auto& acer = d.label_table().at("Acer");
    EXPECT_EQ(acer.at("en"), "Maple");
    EXPECT_EQ(acer.at("fr"), "Erable");
    EXPECT_EQ(acer.at("de"), "Acer Baum");
}

TEST(Db, AddModelRejectsInvalidRecord) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "en", true);
    auto bad = make_model("Acer", "/a/Acer.lbw.gz");
    bad.model.default_variant = "nope";
    EXPECT_THROW(d.add_model(bad), record::RecordError);
    EXPECT_EQ(d.model_count(), 0);
}

TEST(Db, EnumerationIsSortedAndRestartable) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "en", true);
    for (const char* name : {"Pinus", "Acer", "Zelkova", "Betula", "acer"})
        d.add_model(make_model(name, std::string("/a/") + name));

    std::vector<std::string> first;
    for (const auto& m : d.models()) first.push_back(m.name());

    std::vector<std::string> second;
    auto range = d.models();
    for (auto it = range.begin(); it != range.end(); ++it) second.push_back((*it).name());

    std::vector<std::string> expected{"Acer", "Betula", "Pinus", "Zelkova", "acer"};
    EXPECT_EQ(first, expected);
    EXPECT_EQ(second, expected);

    std::vector<std::string> third;
    for (const auto& m : range) third.push_back(m.name());
    EXPECT_EQ(third, expected);
    EXPECT_EQ(range.size(), 5u);
}

template <typename T>
concept EnumerableFrom = requires(T&& d) { std::forward<T>(d).models(); };

TEST(Db, EnumerationNeedsALiveDatabase) {
    static_assert(EnumerableFrom<const DB&>);
    static_assert(EnumerableFrom<DB&>);
    static_assert(!EnumerableFrom<DB>);
    static_assert(!EnumerableFrom<const DB>);
}

TEST(Db, ViewsResolveLabelsAndDefaults) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "de_AT", true);
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));

    auto m = d.get_model("", "Acer");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->label(), "Acer Baum");
    EXPECT_EQ(m->md5(), "d41d8cd98f00b204e9800998ecf8427e");

    ASSERT_EQ(m->variants().size(), 2u);
    EXPECT_EQ(m->variants()[0].name(), "Acer adult");
    EXPECT_EQ(m->variants()[1].name(), "Acer young");
    EXPECT_EQ(m->variants()[1].index(), 1);

    const auto& def = m->get_variant();
    EXPECT_EQ(def.name(), "Acer adult");
    EXPECT_EQ(m->get_variant("Acer young").name(), "Acer young");
    EXPECT_EQ(m->get_variant("Acer ancient").name(), "Acer adult");

    // An empty variant preview falls back to the model preview.
    EXPECT_EQ(def.preview(), "/previews/Acer.png");
    EXPECT_EQ(m->get_variant("Acer young").preview(), "/previews/Acer_young.png");

    EXPECT_EQ(def.get_season().name(), "Summer");
    EXPECT_EQ(def.get_season().label(), "Sommer");
    EXPECT_EQ(def.get_season("Winter").name(), "Winter");
    EXPECT_EQ(def.get_season("Winter").label(), "Winter");
    EXPECT_EQ(def.get_season("Monsoon").name(), "Summer");
    ASSERT_EQ(def.seasons().size(), 3u);
    EXPECT_EQ(def.seasons()[2].name(), "Winter");
}

TEST(Db, ViewsDoNotAliasTheDocument) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "en", true);
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));

    auto before = d.get_model("", "Acer");
    auto replaced = make_model("Acer", "/moved/Acer.lbw.gz");
    replaced.labels["Acer"]["en"] = "Maple";
    d.add_model(replaced);

    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->filepath(), "/a/Acer.lbw.gz");
    EXPECT_EQ(before->label(), "Acer tree");
    EXPECT_EQ(d.get_model("", "Acer")->label(), "Maple");
}

TEST(Db, LabelUsesDatabaseLocaleUnlessOverridden) {
    auto root = unique_test_root();
    auto d = DB::open((root / "plants.json").string(), "en_GB", true);
    d.add_model(make_model("Acer", "/a/Acer.lbw.gz"));
    EXPECT_EQ(d.locale(), "en-GB");
    EXPECT_EQ(d.label("Acer"), "Acer tree");
    EXPECT_EQ(d.label("Acer", "de"), "Acer Baum");
    EXPECT_EQ(d.label("Acer", "fr"), "Acer");
}

TEST(Db, ParseExtractorVersion) {
    auto v = db::parse_extractor_version(" 2.1.7 \n");
    EXPECT_EQ(v.version, "2.1.7");
    EXPECT_EQ(v.major, 2);
    EXPECT_EQ(v.minor, 1);
    EXPECT_EQ(v.micro, 7);

    auto partial = db::parse_extractor_version("3");
    EXPECT_EQ(partial.major, 3);
    EXPECT_EQ(partial.minor, 0);
    EXPECT_TRUE(db::parse_extractor_version("").version.empty());
}
