#include "thicket/adapter.h"
#include "thicket/labels.h"

#include "cli_logger.h"

#include <openssl/evp.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace thicket::adapter {

using json = record::json;

std::string md5_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("reading " + path);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        throw std::runtime_error("md5: digest init failed");

    char buf[4096];
    while (f.read(buf, sizeof(buf)) || f.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buf, static_cast<size_t>(f.gcount())) != 1)
            throw std::runtime_error("md5: digest update failed");
    }
    if (f.bad()) throw std::runtime_error("reading " + path);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1)
        throw std::runtime_error("md5: digest final failed");

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; i++) hex << std::setw(2) << static_cast<int>(digest[i]);
    return hex.str();
}

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string extractor_version(const std::string& extractor) {
    process::Result r;
    try {
        r = process::run(extractor, {"--version"});
    } catch (const std::runtime_error& e) {
        throw ExtractError(e.what());
    }
    if (r.status != 0)
        throw ExtractError(extractor + " --version exited with status " + std::to_string(r.status));
    return trim(r.output);
}

// The extractor reports its parameters as
// {"name": ..., "enum": {"default": <index>, "options": [{"name", "labels"}]}}.
static const json& find_param_enum(const json& raw, const std::string& name) {
    for (const auto& p : raw.at("params")) {
        if (p.at("name").get<std::string>() == name) return p.at("enum");
    }
    throw ExtractError("extractor output has no \"" + name + "\" parameter");
}

static const json& default_option(const json& e, const std::string& param) {
    const auto& options = e.at("options");
    auto idx = e.at("default").get<int>();
    if (idx < 0 || static_cast<size_t>(idx) >= options.size())
        throw ExtractError("default " + param + " index " + std::to_string(idx) + " out of range");
    return options.at(static_cast<size_t>(idx));
}

// Keeps the first text seen for each locale.
static labels::LocaleLabels first_label_per_locale(const json& list) {
    labels::LocaleLabels out;
    for (const auto& l : list) {
        auto locale = labels::normalize_locale(l.at("lang").get<std::string>());
        out.emplace(std::move(locale), l.at("text").get<std::string>());
    }
    return out;
}

static bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

record::ParsedModel model_from_extract(const json& raw, const std::string& filepath,
                                       const std::string& md5) {
    record::ParsedModel parsed;
    auto& model = parsed.model;

    try {
        model.name = raw.at("name").get<std::string>();
        model.filepath = filepath;
        model.md5 = md5;

        const auto& variant_enum = find_param_enum(raw, "variant");
        model.default_variant = default_option(variant_enum, "variant").at("name").get<std::string>();

        // "oak.lbw.gz" looks for "oak.lbw.png", then "oak.png".
        fs::path asset(filepath);
        fs::path dir = fs::absolute(asset).parent_path();
        std::string preview_stem = asset.stem().string();
        fs::path preview = dir / (preview_stem + ".png");
        if (!is_file(preview)) {
            preview_stem = fs::path(preview_stem).stem().string();
            preview = dir / (preview_stem + ".png");
            if (!is_file(preview)) {
                LOGW("preview not found:", preview.string());
                preview.clear();
            }
        }
        model.preview = preview.string();

        parsed.labels[model.name] = first_label_per_locale(raw.at("plant_meta").at("labels"));

        const auto& season_enum = find_param_enum(raw, "season");
        std::vector<std::string> seasons;
        for (const auto& s : season_enum.at("options")) {
            auto name = s.at("name").get<std::string>();
            parsed.labels[name] = first_label_per_locale(s.at("labels"));
            seasons.push_back(std::move(name));
        }
        std::string default_season = default_option(season_enum, "season").at("name").get<std::string>();

        int index = 0;
        for (const auto& v : raw.at("variants")) {
            auto vname = v.at("name").get<std::string>();

            record::VariantRecord rec;
            rec.index = index++;
            rec.seasons = seasons;
            rec.default_season = default_season;

            fs::path vpreview = dir / "models" / (preview_stem + "_" + vname + ".png");
            if (!is_file(vpreview)) {
                LOGW("preview not found:", vpreview.string());
                vpreview.clear();
            }
            rec.preview = vpreview.string();

            labels::LocaleLabels vlabels;
            for (const auto& opt : variant_enum.at("options")) {
                if (opt.at("name").get<std::string>() == vname) {
                    vlabels = first_label_per_locale(opt.at("labels"));
                    break;
                }
            }
            parsed.labels[vname] = std::move(vlabels);
            model.variants[vname] = std::move(rec);
        }
    } catch (const json::exception& e) {
        throw ExtractError(filepath + ": unexpected extractor output: " + e.what());
    }

    try {
        record::validate(model);
    } catch (const record::RecordError& e) {
        throw ExtractError(filepath + ": " + e.what());
    }
    return parsed;
}

record::ParsedModel parse_model(const std::string& filepath, const std::string& extractor) {
    process::Result r;
    try {
        r = process::run(extractor, {filepath});
    } catch (const std::runtime_error& e) {
        throw ExtractError(e.what());
    }
    if (r.status != 0)
        throw ExtractError(filepath + ": extractor exited with status " + std::to_string(r.status));

    json raw;
    try {
        raw = json::parse(r.output);
    } catch (const json::parse_error& e) {
        throw ExtractError(filepath + ": extractor output is not JSON: " + e.what());
    }

    return model_from_extract(raw, filepath, md5_file(filepath));
}

// ---------------------------------------------------------------------------
// WorkerLauncher
// ---------------------------------------------------------------------------

namespace {

class WorkerJob : public Job {
public:
    explicit WorkerJob(std::string asset) : asset_(std::move(asset)) {}

    const std::string& asset() const override { return asset_; }
    process::Result wait() override { return child_.wait(); }

    process::Child& child() { return child_; }

private:
    std::string asset_;
    process::Child child_;
};

} // namespace

WorkerLauncher::WorkerLauncher(std::string program, std::string extractor,
                               std::vector<std::string> extra_args)
    : program_(std::move(program)),
      extractor_(std::move(extractor)),
      extra_args_(std::move(extra_args)) {}

std::vector<std::string> WorkerLauncher::worker_args(const std::string& asset) const {
    std::vector<std::string> args = extra_args_;
    args.insert(args.end(), {"parse_model", "-f", asset, "-s", extractor_});
    return args;
}

std::unique_ptr<Job> WorkerLauncher::launch(const std::string& asset) {
    auto job = std::make_unique<WorkerJob>(asset);
    if (!job->child().launch(program_, worker_args(asset)))
        throw std::runtime_error("starting worker for " + asset + ": " + std::strerror(errno));
    return job;
}

std::string WorkerLauncher::extractor_version() {
    return adapter::extractor_version(extractor_);
}

} // namespace thicket::adapter
