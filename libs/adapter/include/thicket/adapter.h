#pragma once

#include "thicket/process.h"
#include "thicket/record.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace thicket::adapter {

// ExtractError reports an extractor that failed or printed something that
// is not a plant description.
class ExtractError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Worker side: turn one asset into a ParsedModel
// ---------------------------------------------------------------------------

// md5_file returns the lowercase hex MD5 of the file contents.
std::string md5_file(const std::string& path);

// extractor_version runs "<extractor> --version" and returns its trimmed output.
std::string extractor_version(const std::string& extractor);

// model_from_extract builds the record for filepath from the JSON the
// extractor printed for it. Preview images are looked up next to the asset;
// missing ones are logged and left empty.
record::ParsedModel model_from_extract(const record::json& raw, const std::string& filepath,
                                       const std::string& md5);

// parse_model runs the extractor on filepath and builds its record.
record::ParsedModel parse_model(const std::string& filepath, const std::string& extractor);

// ---------------------------------------------------------------------------
// Coordinator side: run parse_model out of process
// ---------------------------------------------------------------------------

// Job is one in-flight adapter invocation.
class Job {
public:
    virtual ~Job() = default;

    virtual const std::string& asset() const = 0;

    // wait blocks until the job has finished and returns its exit status
    // and the wire blob it printed.
    virtual process::Result wait() = 0;
};

// Launcher starts adapter invocations. The build scheduler only talks to
// the adapter through this interface.
class Launcher {
public:
    virtual ~Launcher() = default;

    // launch starts parsing asset. Throws std::runtime_error if the job
    // could not be started.
    virtual std::unique_ptr<Job> launch(const std::string& asset) = 0;

    // extractor_version reports the extractor release used for the jobs.
    virtual std::string extractor_version() = 0;
};

// WorkerLauncher runs each job as "<program> [extra_args] parse_model -f
// <asset> -s <extractor>", one process per asset.
class WorkerLauncher : public Launcher {
public:
    WorkerLauncher(std::string program, std::string extractor,
                   std::vector<std::string> extra_args = {});

    std::unique_ptr<Job> launch(const std::string& asset) override;
    std::string extractor_version() override;

    std::vector<std::string> worker_args(const std::string& asset) const;

private:
    std::string program_;
    std::string extractor_;
    std::vector<std::string> extra_args_;
};

} // namespace thicket::adapter
