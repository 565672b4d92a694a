#pragma once

#include "thicket/adapter.h"
#include "thicket/db.h"

#include <functional>
#include <string>
#include <vector>

namespace thicket::build {

// BuildProgress reports the state of a rebuild.
struct BuildProgress {
    std::string phase; // "discovery", "launch", "added", "failed", "save"
    int index = 0;     // results collected so far
    int total = 0;     // assets found
    std::string asset;
    std::string message; // model name for "added", reason for "failed"
};

using BuildProgressFunc = std::function<void(const BuildProgress&)>;

struct BuildOptions {
    int jobs = 0; // maximum concurrent workers; 0 picks default_jobs()
};

struct BuildResult {
    int succeeded = 0;
    int total = 0;
};

// default_jobs returns the number of processing units, or 4 if unknown.
int default_jobs();

// scan_assets returns <assets_dir>/*/*.lbw.gz and <assets_dir>/*/*.lbw,
// sorted. Throws std::runtime_error if assets_dir is not a directory.
std::vector<std::string> scan_assets(const std::string& assets_dir);

// build replaces the contents of db with one model per asset found in
// assets_dir, parsing at most opts.jobs assets at a time through launcher.
// Results are collected strictly in launch order and merged one by one.
// An asset whose job fails is logged and left out. The database is saved
// before returning.
BuildResult build(db::DB& db, const std::string& assets_dir, adapter::Launcher& launcher,
                  const BuildOptions& opts = {}, BuildProgressFunc progress = nullptr);

} // namespace thicket::build
