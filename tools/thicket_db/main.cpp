#include "thicket/adapter.h"
#include "thicket/build.h"
#include "thicket/db.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

struct Config {
    std::string db;
    std::string assets;
    std::string extractor;
    std::string locale = "en-US";
    int jobs = 0;
};

static Config load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("reading config " + path);
    json j = json::parse(f);
    Config cfg;
    if (j.contains("db")) cfg.db = j["db"].get<std::string>();
    if (j.contains("assets")) cfg.assets = j["assets"].get<std::string>();
    if (j.contains("extractor")) cfg.extractor = j["extractor"].get<std::string>();
    if (j.contains("locale")) cfg.locale = j["locale"].get<std::string>();
    if (j.contains("jobs")) cfg.jobs = j["jobs"].get<int>();
    return cfg;
}

static void print_usage() {
    std::cerr << "Usage: thicket_db <command> [flags]\n\n"
              << "Plant model database tool.\n\n"
              << "Commands:\n"
              << "  read          Print the database contents (requires -db)\n"
              << "  build         Scan the assets path and rebuild the database\n"
              << "                (requires -db -assets -s)\n"
              << "  add           Parse one asset and add it to the database (requires -db -f -s)\n"
              << "  parse_model   Parse one asset and print its record JSON (requires -f -s)\n\n"
              << "Flags:\n"
              << "  -config <path>    Config file (JSON: db, assets, extractor, locale, jobs)\n"
              << "  -db <path>        Database file path\n"
              << "  -assets <dir>     Plant assets directory (alias: -p)\n"
              << "  -s <path>         Plant extractor executable (alias: -extractor)\n"
              << "  -f <path>         Plant asset file (.lbw.gz)\n"
              << "  -model <name>     Only print this model (read)\n"
              << "  -locale <tag>     Label locale (default en-US)\n"
              << "  -j <n>            Parallel parse jobs (default: CPU count)\n"
              << "  --json            Print models as JSON (read)\n"
              << "  -v, --verbose     Verbose logging\n"
              << "  -vv, --debug      Debug logging\n";
}

static std::string self_path(const char* argv0) {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return exe.string();
    return argv0;
}

static json model_to_json(const thicket::db::ModelView& m) {
    json variants = json::array();
    for (const auto& v : m.variants()) {
        json seasons = json::array();
        for (const auto& s : v.seasons()) seasons.push_back({{"name", s.name()}, {"label", s.label()}});
        variants.push_back({
            {"name", v.name()},
            {"label", v.label()},
            {"index", v.index()},
            {"preview", v.preview()},
            {"defaultSeason", v.get_season().name()},
            {"seasons", std::move(seasons)},
        });
    }
    return {
        {"name", m.name()},
        {"label", m.label()},
        {"filepath", m.filepath()},
        {"md5", m.md5()},
        {"preview", m.preview()},
        {"defaultVariant", m.get_variant().name()},
        {"variants", std::move(variants)},
    };
}

static void print_model(const thicket::db::ModelView& m) {
    std::cout << m.name() << " (" << m.label() << ")\n";
    std::cout << "\tfile: " << m.filepath() << '\n';
    std::cout << "\tmd5: " << m.md5() << '\n';
    const auto& def = m.get_variant();
    std::cout << "\tdefault_variant: " << def.name() << " (" << def.label() << ")\n";
    std::cout << "\tvariants:\n";
    for (const auto& v : m.variants()) {
        std::cout << "\t\t" << v.name() << " (" << v.get_season().label() << ") [";
        for (size_t i = 0; i < v.seasons().size(); i++) {
            if (i > 0) std::cout << ", ";
            std::cout << v.seasons()[i].name();
        }
        std::cout << "]\n";
    }
}

static void print_info(const thicket::db::DB& db) {
    const auto& info = db.info();
    std::cout << "Extractor version: " << info.extractor.version << '\n';
    std::cout << "\tmajor: " << info.extractor.major << '\n';
    std::cout << "\tminor: " << info.extractor.minor << '\n';
    std::cout << "\tmicro: " << info.extractor.micro << '\n';
    std::cout << "Schema version: " << info.schema_version << '\n';
    std::cout << "Loaded " << db.model_count() << " models:\n";
}

static int do_read(const Config& cfg, const std::string& model, const std::string& file,
                   bool as_json) {
    auto db = thicket::db::DB::open(cfg.db, cfg.locale, false);

    std::vector<thicket::db::ModelView> selected;
    if (!model.empty() || !file.empty()) {
        auto m = db.get_model(file, model);
        if (!m) {
            LOGE("model not found:", model.empty() ? file : model);
            return 1;
        }
        selected.push_back(*m);
    }

    if (as_json) {
        json arr = json::array();
        if (selected.empty()) {
            for (const auto& m : db.models()) arr.push_back(model_to_json(m));
        } else {
            arr.push_back(model_to_json(selected.front()));
        }
        std::cout << std::setw(2) << arr << '\n';
        return 0;
    }

    print_info(db);
    if (selected.empty()) {
        for (const auto& m : db.models()) print_model(m);
    } else {
        print_model(selected.front());
    }
    return 0;
}

// open_for_build opens the database, discarding one that is stale or
// unreadable since a build replaces everything anyway.
static thicket::db::DB open_for_build(const Config& cfg) {
    try {
        return thicket::db::DB::open(cfg.db, cfg.locale, true);
    } catch (const thicket::db::StaleSchemaError& e) {
        LOGW("schema outdated, removing old database and rebuilding:", e.what());
    } catch (const thicket::db::CorruptError& e) {
        LOGW("database unreadable, removing it and rebuilding:", e.what());
    }
    fs::remove(cfg.db);
    return thicket::db::DB::open(cfg.db, cfg.locale, true);
}

static void stderr_progress(const thicket::build::BuildProgress& p) {
    if (p.phase == "discovery") {
        std::cerr << "Discovered " << p.total << " models\n";
    } else if (p.phase == "added" || p.phase == "failed") {
        int width = static_cast<int>(std::to_string(p.total).size());
        std::cerr << "\r[" << std::setw(width) << p.index << '/' << p.total << "] "
                  << fs::path(p.asset).filename().string() << "\033[K";
    } else if (p.phase == "save") {
        std::cerr << "\nSaving " << p.asset << "...\n";
    }
}

static int do_build(const Config& cfg, const std::string& self) {
    auto db = open_for_build(cfg);
    thicket::adapter::WorkerLauncher launcher(self, cfg.extractor, thicket::log::verbosity_args());

    // Workers log to the same terminal; only draw the counter when quiet.
    thicket::build::BuildProgressFunc progress;
    if (!thicket::log::verbose_enabled()) progress = stderr_progress;

    auto result = thicket::build::build(db, cfg.assets, launcher, {.jobs = cfg.jobs}, progress);
    std::cout << "Processed " << result.succeeded << "/" << result.total << " models\n";
    return 0;
}

static int do_add(const Config& cfg, const std::string& file) {
    auto db = thicket::db::DB::open(cfg.db, cfg.locale, true);
    auto parsed = thicket::adapter::parse_model(file, cfg.extractor);
    db.add_model(parsed);
    db.save();
    LOGI("added", "\"" + parsed.model.name + "\"");
    std::cout << "Added " << parsed.model.name << " (" << db.label(parsed.model.name) << ")\n";
    return 0;
}

static int do_parse_model(const Config& cfg, const std::string& file) {
    auto parsed = thicket::adapter::parse_model(file, cfg.extractor);
    std::cout << thicket::record::to_wire(parsed).dump() << '\n';
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::string db_flag;
    std::string assets_flag;
    std::string extractor_flag;
    std::string locale_flag;
    std::string file;
    std::string model;
    int jobs_flag = 0;
    bool as_json = false;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-config") == 0 && i + 1 < argc) config_path = argv[++i];
        else if (std::strcmp(argv[i], "-db") == 0 && i + 1 < argc) db_flag = argv[++i];
        else if ((std::strcmp(argv[i], "-assets") == 0 || std::strcmp(argv[i], "-p") == 0) && i + 1 < argc)
            assets_flag = argv[++i];
        else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "-extractor") == 0) && i + 1 < argc)
            extractor_flag = argv[++i];
        else if (std::strcmp(argv[i], "-f") == 0 && i + 1 < argc) file = argv[++i];
        else if (std::strcmp(argv[i], "-model") == 0 && i + 1 < argc) model = argv[++i];
        else if (std::strcmp(argv[i], "-locale") == 0 && i + 1 < argc) locale_flag = argv[++i];
        else if (std::strcmp(argv[i], "-j") == 0 && i + 1 < argc) jobs_flag = std::atoi(argv[++i]);
        else if (std::strcmp(argv[i], "--json") == 0) as_json = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) verbosity = 1;
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (command.empty() && argv[i][0] != '-') {
            command = argv[i];
        } else {
            std::cerr << "Error: unexpected argument " << argv[i] << "\n\n";
            print_usage();
            return 1;
        }
    }

    thicket::cli::set_verbosity(verbosity);

    // Load config
    Config cfg;
    if (!config_path.empty()) {
        try {
            cfg = load_config(config_path);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << '\n';
            return 1;
        }
    }

    // Override with flags
    if (!db_flag.empty()) cfg.db = db_flag;
    if (!assets_flag.empty()) cfg.assets = assets_flag;
    if (!extractor_flag.empty()) cfg.extractor = extractor_flag;
    if (!locale_flag.empty()) cfg.locale = locale_flag;
    if (jobs_flag > 0) cfg.jobs = jobs_flag;

    try {
        if (command == "read" && !cfg.db.empty()) {
            return do_read(cfg, model, file, as_json);
        } else if (command == "build" && !cfg.db.empty() && !cfg.assets.empty() &&
                   !cfg.extractor.empty()) {
            return do_build(cfg, self_path(argv[0]));
        } else if (command == "add" && !cfg.db.empty() && !file.empty() && !cfg.extractor.empty()) {
            return do_add(cfg, file);
        } else if (command == "parse_model" && !file.empty() && !cfg.extractor.empty()) {
            return do_parse_model(cfg, file);
        }
    } catch (const thicket::db::NotFoundError& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    } catch (const thicket::db::StaleSchemaError& e) {
        std::cerr << "Error: " << e.what() << "\nRun the build command to recreate it.\n";
        return 1;
    } catch (const std::exception& e) {
        LOGE(command + ":", e.what());
        return 1;
    }

    print_usage();
    return 1;
}
