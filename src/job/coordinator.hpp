#pragma once

#include "core/types.hpp"
#include "job/job.hpp"
#include "job/job_state.hpp"
#include "package/epub_writer.hpp"
#include "package/format_converter.hpp"
#include "source/page_source.hpp"
#include "transform/upscaler.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace panelpress {

struct ConversionRequest {
    std::string session_id;
    std::vector<std::string> source_ids;
    BookMetadata metadata;
    TransformOptions transform;
    bool merge = false;
    size_t max_volume_bytes = 200ull * 1024 * 1024;
    OutputFormat format = OutputFormat::Primary;
    std::string naming_pattern = "{series} - Chapter {index:03d}";
};

struct SubmitResult {
    Result result;
    // Meaningful only when the request was rejected.
    ErrorKind rejection = ErrorKind::Fatal;
    ConversionJob job;
};

class JobCoordinator {
public:
    struct Config {
        std::string output_dir = "./.data/output";
        int workers = 0;
        float max_failure_ratio = 0.5f;
        bool allow_partial = true;
        bool keep_partial_output = false;
        ExternalUpscaler::Config upscaler;
    };

    JobCoordinator(const Config& config, std::shared_ptr<SourceProvider> sources,
                   std::shared_ptr<FormatConverter> converter);
    ~JobCoordinator();

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator& operator=(const JobCoordinator&) = delete;

    // Replaces the upscaler used for UpscaleMethod::External.
    void set_external_upscaler(std::shared_ptr<Upscaler> upscaler);

    // Validates and starts the job in the background; never blocks on it.
    SubmitResult submit(const ConversionRequest& request);

    std::optional<ConversionJob> status(const std::string& job_id) const;
    std::vector<ConversionJob> list_jobs(const std::string& session_id = "") const;

    // Output files of a completed job.
    std::optional<std::vector<std::string>> outputs(const std::string& job_id) const;
    std::optional<std::string> artifact_path(const std::string& job_id, const std::string& filename) const;
    Result bundle(const std::string& job_id, const std::string& zip_path) const;

    // Cancels the session's jobs, waits for them, removes their files and forgets them.
    Result delete_session(const std::string& session_id);

    std::string job_dir(const std::string& session_id, const std::string& job_id) const;

private:
    struct JobRecord {
        ConversionJob job;
        ConversionRequest request;
        ProgressModel progress;
        std::atomic<bool> cancel{false};
        mutable std::mutex mutex;
        std::thread worker;
    };

    Config config_;
    std::shared_ptr<SourceProvider> sources_;
    std::shared_ptr<FormatConverter> converter_;
    std::shared_ptr<Upscaler> external_upscaler_;

    mutable std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<JobRecord>> jobs_;

    Result validate(const ConversionRequest& request, ErrorKind& kind) const;

    void run(JobRecord& rec);
    void execute(JobRecord& rec);

    bool transition(JobRecord& rec, JobPhase next);
    void fail(JobRecord& rec, ErrorKind kind, const std::string& message);
    void set_current_file(JobRecord& rec, const std::string& name);
    void warn(JobRecord& rec, const std::string& message);
    bool document_failed(JobRecord& rec, const std::string& name, const std::string& message);
    void discard_outputs(JobRecord& rec, const std::vector<std::string>& files);

    std::shared_ptr<Upscaler> upscaler_for(UpscaleMethod method) const;
};

}
