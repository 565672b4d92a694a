#include "thicket/build.h"

#include "cli_logger.h"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace thicket::build {

int default_jobs() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc > 0 ? static_cast<int>(hc) : 4;
}

static bool is_asset_name(const std::string& name) {
    return name.ends_with(".lbw.gz") || name.ends_with(".lbw");
}

std::vector<std::string> scan_assets(const std::string& assets_dir) {
    std::error_code ec;
    if (!fs::is_directory(assets_dir, ec))
        throw std::runtime_error("assets directory not found: " + assets_dir);

    std::vector<std::string> files;
    for (const auto& plant_dir : fs::directory_iterator(assets_dir)) {
        if (!plant_dir.is_directory(ec)) continue;
        for (const auto& entry : fs::directory_iterator(plant_dir.path())) {
            if (!entry.is_regular_file(ec)) continue;
            if (is_asset_name(entry.path().filename().string()))
                files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

namespace {

struct Scheduler {
    db::DB& db;
    BuildProgressFunc& progress;
    BuildResult result;
    int collected = 0;

    void report(const char* phase, const std::string& asset, const std::string& message = "") {
        if (!progress) return;
        BuildProgress bp;
        bp.phase = phase;
        bp.index = collected;
        bp.total = result.total;
        bp.asset = asset;
        bp.message = message;
        progress(bp);
    }

    void fail(const std::string& asset, const std::string& reason) {
        LOGE("failed to parse", asset + ":", reason);
        report("failed", asset, reason);
    }

    // merge applies one finished job to the database.
    void merge(const std::string& asset, const process::Result& r) {
        collected++;
        if (r.status != 0) {
            fail(asset, "worker exited with status " + std::to_string(r.status));
            return;
        }

        record::ParsedModel parsed;
        try {
            parsed = record::parse_wire(r.output);
        } catch (const record::RecordError& e) {
            fail(asset, e.what());
            return;
        }

        db.add_model(parsed);
        result.succeeded++;
        LOGI("added", "\"" + parsed.model.name + "\"");
        report("added", asset, parsed.model.name);
    }
};

} // namespace

BuildResult build(db::DB& db, const std::string& assets_dir, adapter::Launcher& launcher,
                  const BuildOptions& opts, BuildProgressFunc progress) {
    auto files = scan_assets(assets_dir);
    db.initialize(db::parse_extractor_version(launcher.extractor_version()));

    Scheduler s{db, progress, {}, 0};
    s.result.total = static_cast<int>(files.size());
    s.report("discovery", assets_dir);

    const size_t num_jobs = static_cast<size_t>(opts.jobs > 0 ? opts.jobs : default_jobs());
    LOGI("parsing", files.size(), "models using", num_jobs, "parallel jobs");

    std::deque<std::string> pending(files.begin(), files.end());
    std::deque<std::unique_ptr<adapter::Job>> jobs;

    while (!pending.empty() || !jobs.empty()) {
        // Keep up to num_jobs jobs running
        while (jobs.size() < num_jobs && !pending.empty()) {
            std::string f = std::move(pending.front());
            pending.pop_front();
            LOGD("parsing:", f);
            try {
                jobs.push_back(launcher.launch(f));
                s.report("launch", f);
            } catch (const std::runtime_error& e) {
                s.collected++;
                s.fail(f, e.what());
            }
        }
        if (jobs.empty()) continue;

        // Wait for the oldest job to complete
        auto job = std::move(jobs.front());
        jobs.pop_front();
        auto r = job->wait();
        s.merge(job->asset(), r);
    }

    if (!pending.empty())
        LOGE("exited worker loop with", pending.size(), "model files remaining");
    if (!jobs.empty())
        LOGE("exited worker loop with", jobs.size(), "jobs still running");

    s.report("save", db.path());
    db.save();
    LOGI("processed", std::to_string(s.result.succeeded) + "/" + std::to_string(s.result.total),
         "models");
    return s.result;
}

} // namespace thicket::build
