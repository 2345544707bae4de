#include "job/coordinator.hpp"
#include "job/naming.hpp"
#include "package/assembler.hpp"
#include "package/bundle.hpp"
#include "plan/size_estimator.hpp"
#include "plan/volume_planner.hpp"
#include "transform/page_transformer.hpp"
#include "transform/transform_stage.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <utility>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace panelpress {

namespace fs = std::filesystem;

JobCoordinator::JobCoordinator(const Config& config, std::shared_ptr<SourceProvider> sources,
                               std::shared_ptr<FormatConverter> converter)
    : config_(config), sources_(std::move(sources)), converter_(std::move(converter)) {
    if (!converter_) {
        converter_ = std::make_shared<DisabledConverter>();
    }
    external_upscaler_ = std::make_shared<ExternalUpscaler>(config_.upscaler);
}

JobCoordinator::~JobCoordinator() {
    std::vector<JobRecord*> records;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto& [id, rec] : jobs_) {
            rec->cancel.store(true);
            records.push_back(rec.get());
        }
    }
    for (JobRecord* rec : records) {
        if (rec->worker.joinable()) rec->worker.join();
    }
}

void JobCoordinator::set_external_upscaler(std::shared_ptr<Upscaler> upscaler) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    external_upscaler_ = std::move(upscaler);
}

std::shared_ptr<Upscaler> JobCoordinator::upscaler_for(UpscaleMethod method) const {
    if (method == UpscaleMethod::External) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        return external_upscaler_;
    }
    return create_upscaler(method, config_.upscaler);
}

std::string JobCoordinator::job_dir(const std::string& session_id, const std::string& job_id) const {
    return (fs::path(config_.output_dir) / session_id / job_id).string();
}

Result JobCoordinator::validate(const ConversionRequest& request, ErrorKind& kind) const {
    kind = ErrorKind::Fatal;
    if (request.session_id.empty() || request.session_id.find('/') != std::string::npos ||
        request.session_id.find("..") != std::string::npos) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid session id");
    }
    if (request.source_ids.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "no sources selected");
    }
    std::set<std::string> unique_ids(request.source_ids.begin(), request.source_ids.end());
    if (unique_ids.size() != request.source_ids.size()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "a source is selected more than once");
    }
    const TransformOptions& t = request.transform;
    if (t.target_width <= 0 || t.target_height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "target dimensions must be positive");
    }
    if (t.jpeg_quality < 1 || t.jpeg_quality > 100) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "jpeg quality must be between 1 and 100");
    }
    if (t.spread_ratio < 1.0f) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "spread ratio must be at least 1.0");
    }
    if (request.naming_pattern.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "naming pattern must not be empty");
    }

    size_t largest = 0;
    for (const auto& id : request.source_ids) {
        if (!sources_->contains(request.session_id, id)) {
            kind = ErrorKind::Document;
            return Result::fail(ErrorCode::FILE_NOT_FOUND, "source not found: " + id);
        }
        auto summary = sources_->describe(request.session_id, id);
        if (!summary) {
            kind = ErrorKind::Document;
            return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot read source: " + id);
        }
        largest = std::max(largest, summary->largest_page_bytes);
    }
    Result budget = VolumePlanner::validate_budget(request.max_volume_bytes, largest, SizeEstimator());
    if (budget.failure()) kind = ErrorKind::BudgetValidation;
    return budget;
}

SubmitResult JobCoordinator::submit(const ConversionRequest& request) {
    SubmitResult out;
    out.result = validate(request, out.rejection);
    if (out.result.failure()) {
        log::warning("rejected job for session " + request.session_id + ": " + out.result.message);
        return out;
    }

    auto rec = std::make_unique<JobRecord>();
    rec->request = request;
    ConversionJob& job = rec->job;
    job.id = make_id();
    job.session_id = request.session_id;
    job.source_ids = request.source_ids;
    job.merge = request.merge;
    job.max_volume_bytes = request.max_volume_bytes;
    job.format = request.format;
    job.created_ms = now_unix_ms();
    out.job = job;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    JobRecord* raw = rec.get();
    jobs_[job.id] = std::move(rec);
    raw->worker = std::thread([this, raw] { run(*raw); });
    log::info("job " + out.job.id + " submitted: " + std::to_string(request.source_ids.size()) +
              " source(s), merge=" + (request.merge ? "true" : "false") +
              ", format=" + to_string(request.format));
    return out;
}

std::optional<ConversionJob> JobCoordinator::status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    std::lock_guard<std::mutex> job_lock(it->second->mutex);
    return it->second->job;
}

std::vector<ConversionJob> JobCoordinator::list_jobs(const std::string& session_id) const {
    std::vector<ConversionJob> out;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& [id, rec] : jobs_) {
        std::lock_guard<std::mutex> job_lock(rec->mutex);
        if (session_id.empty() || rec->job.session_id == session_id) {
            out.push_back(rec->job);
        }
    }
    std::sort(out.begin(), out.end(), [](const ConversionJob& a, const ConversionJob& b) {
        return a.created_ms != b.created_ms ? a.created_ms < b.created_ms : a.id < b.id;
    });
    return out;
}

std::optional<std::vector<std::string>> JobCoordinator::outputs(const std::string& job_id) const {
    auto job = status(job_id);
    if (!job || job->phase != JobPhase::Completed) return std::nullopt;
    return job->output_files;
}

std::optional<std::string> JobCoordinator::artifact_path(const std::string& job_id,
                                                         const std::string& filename) const {
    auto job = status(job_id);
    if (!job || job->phase != JobPhase::Completed) return std::nullopt;
    if (std::find(job->output_files.begin(), job->output_files.end(), filename) == job->output_files.end()) {
        return std::nullopt;
    }
    return (fs::path(job_dir(job->session_id, job->id)) / filename).string();
}

Result JobCoordinator::bundle(const std::string& job_id, const std::string& zip_path) const {
    auto job = status(job_id);
    if (!job) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "unknown job " + job_id);
    }
    if (job->phase != JobPhase::Completed) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "job " + job_id + " is not completed");
    }
    return write_bundle(zip_path, job_dir(job->session_id, job->id), job->output_files);
}

Result JobCoordinator::delete_session(const std::string& session_id) {
    if (session_id.empty() || session_id.find('/') != std::string::npos ||
        session_id.find("..") != std::string::npos) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid session id");
    }
    std::vector<std::unique_ptr<JobRecord>> removed;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->second->job.session_id == session_id) {
                it->second->cancel.store(true);
                removed.push_back(std::move(it->second));
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& rec : removed) {
        if (rec->worker.joinable()) rec->worker.join();
    }

    std::error_code ec;
    fs::remove_all(fs::path(config_.output_dir) / session_id, ec);
    if (ec) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot remove output of session " + session_id + ": " + ec.message());
    }
    log::info("session " + session_id + " deleted (" + std::to_string(removed.size()) + " job(s))");
    return Result::ok();
}

bool JobCoordinator::transition(JobRecord& rec, JobPhase next) {
    std::lock_guard<std::mutex> lock(rec.mutex);
    JobStateMachine state(rec.job);
    if (state.advance(next)) return true;
    state.fail(ErrorKind::Fatal, std::string("invalid transition to ") + to_string(next));
    return false;
}

void JobCoordinator::fail(JobRecord& rec, ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(rec.mutex);
    JobStateMachine(rec.job).fail(kind, message);
}

void JobCoordinator::set_current_file(JobRecord& rec, const std::string& name) {
    std::lock_guard<std::mutex> lock(rec.mutex);
    JobStateMachine(rec.job).set_current_file(name);
}

void JobCoordinator::warn(JobRecord& rec, const std::string& message) {
    log::warning("job " + rec.job.id + ": " + message);
    std::lock_guard<std::mutex> lock(rec.mutex);
    JobStateMachine(rec.job).add_warning(message);
}

bool JobCoordinator::document_failed(JobRecord& rec, const std::string& name, const std::string& message) {
    if (!config_.allow_partial) {
        fail(rec, ErrorKind::Document, message);
        return false;
    }
    warn(rec, "skipped " + name + ": " + message);
    return true;
}

void JobCoordinator::discard_outputs(JobRecord& rec, const std::vector<std::string>& files) {
    if (config_.keep_partial_output) return;
    std::error_code ec;
    fs::path dir = job_dir(rec.job.session_id, rec.job.id);
    for (const auto& f : files) {
        fs::remove(dir / f, ec);
    }
    fs::remove_all(dir, ec);
}

void JobCoordinator::run(JobRecord& rec) {
    try {
        execute(rec);
    } catch (const std::exception& e) {
        fail(rec, ErrorKind::Fatal, std::string("internal error: ") + e.what());
        discard_outputs(rec, {});
    }
}

void JobCoordinator::execute(JobRecord& rec) {
    const ConversionRequest& req = rec.request;
    const std::atomic<bool>& cancel = rec.cancel;

    if (!transition(rec, JobPhase::Extracting)) return;

    std::vector<SourceDocument> documents;
    for (const auto& id : req.source_ids) {
        if (cancel.load()) {
            fail(rec, ErrorKind::Cancelled, "cancelled");
            return;
        }
        set_current_file(rec, id);
        SourceDocument doc;
        Result r = sources_->open(req.session_id, id, doc);
        if (r.failure()) {
            if (!document_failed(rec, id, r.message)) return;
            continue;
        }
        documents.push_back(std::move(doc));
    }

    int total_pages = 0;
    for (const auto& d : documents) total_pages += static_cast<int>(d.pages.size());
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        rec.progress.set_pages(total_pages);
        rec.progress.set_expected_volumes(req.merge ? 1 : std::max<int>(1, static_cast<int>(documents.size())));
    }

    if (!transition(rec, JobPhase::Processing)) return;

    PageTransformer transformer(req.transform, upscaler_for(req.transform.upscale));
    TransformStage::Config stage_cfg;
    stage_cfg.workers = config_.workers;
    stage_cfg.max_failure_ratio = config_.max_failure_ratio;
    TransformStage stage(stage_cfg, transformer);

    auto on_page = [&rec](int, int) {
        std::lock_guard<std::mutex> lock(rec.mutex);
        rec.progress.page_done();
        JobStateMachine(rec.job).report_progress(rec.progress.percent());
    };

    std::vector<PlanningDocument> planned;
    for (const auto& doc : documents) {
        set_current_file(rec, doc.name);
        DocumentTransform result = stage.run(doc, cancel, on_page);
        if (result.cancelled || cancel.load()) {
            fail(rec, ErrorKind::Cancelled, "cancelled");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(rec.mutex);
            JobStateMachine state(rec.job);
            for (const auto& f : result.failures) {
                state.add_failed_page(doc.name + "/" + f.name + ": " + f.message);
            }
            for (const auto& w : result.warnings) {
                state.add_warning(doc.name + "/" + w);
            }
        }
        if (result.result.failure()) {
            if (!document_failed(rec, doc.name, result.result.message)) return;
            continue;
        }
        if (!result.failures.empty()) {
            warn(rec, std::to_string(result.failures.size()) + " page(s) of " + doc.name + " could not be converted");
        }
        planned.push_back({doc.id, doc.name, std::move(result.pages)});
    }
    documents.clear();

    if (planned.empty()) {
        fail(rec, ErrorKind::Document, "no document could be converted");
        return;
    }

    BookMetadata meta = req.metadata;
    if (!meta.cover.empty()) {
        PageTransformer::Outcome cover = transformer.transform_single(meta.cover);
        if (cover.result.success() && !cover.pages.empty()) {
            meta.cover = std::move(cover.pages.front().data);
            meta.cover_size = cover.pages.front().size;
        } else {
            warn(rec, "cover image unusable (" + cover.result.message + "), using first page");
            meta.cover.clear();
        }
    }

    if (req.merge && !transition(rec, JobPhase::Merging)) return;

    SizeEstimator estimator(meta.cover.empty() ? 0 : meta.cover.size() + PageTransformer::PAGE_OVERHEAD_BYTES);
    VolumePlanner::Config plan_cfg;
    plan_cfg.merge = req.merge;
    plan_cfg.max_volume_bytes = req.max_volume_bytes;
    VolumePlanner planner(plan_cfg, estimator);

    // Base names follow document position for separate volumes and volume index for merged ones.
    std::map<std::string, int> position_of;
    for (size_t i = 0; i < req.source_ids.size(); ++i) {
        position_of[req.source_ids[i]] = static_cast<int>(i) + 1;
    }

    VolumePlanner::Plan plan = planner.plan(std::move(planned));
    for (const auto& w : plan.warnings) warn(rec, w);
    if (plan.volumes.empty()) {
        fail(rec, ErrorKind::Fatal, "nothing to package");
        return;
    }
    if (cancel.load()) {
        fail(rec, ErrorKind::Cancelled, "cancelled");
        return;
    }

    const int volume_count = static_cast<int>(plan.volumes.size());
    std::vector<int> name_indices;
    for (const auto& vol : plan.volumes) {
        if (req.merge || vol.source_ids.empty()) {
            name_indices.push_back(vol.index);
        } else {
            name_indices.push_back(position_of[vol.source_ids.front()]);
        }
    }
    std::vector<std::string> basenames = volume_basenames(req.naming_pattern, meta, name_indices);

    // Separate documents are numbered as parts of their own document only.
    std::vector<std::pair<int, int>> title_parts;
    std::map<std::string, int> parts_of;
    if (!req.merge) {
        for (const auto& vol : plan.volumes) {
            if (!vol.source_ids.empty()) ++parts_of[vol.source_ids.front()];
        }
    }
    std::map<std::string, int> seen;
    for (const auto& vol : plan.volumes) {
        if (req.merge || vol.source_ids.empty()) {
            title_parts.emplace_back(vol.index, volume_count);
        } else {
            const std::string& doc = vol.source_ids.front();
            title_parts.emplace_back(++seen[doc], parts_of[doc]);
        }
    }

    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        rec.job.volume_count = volume_count;
        rec.progress.set_volumes(volume_count);
        JobStateMachine(rec.job).report_progress(rec.progress.percent());
    }

    if (!transition(rec, JobPhase::Converting)) return;

    const std::string out_dir = job_dir(req.session_id, rec.job.id);
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        fail(rec, ErrorKind::Fatal, "cannot create " + out_dir + ": " + ec.message());
        return;
    }

    PackageAssembler::Config asm_cfg;
    asm_cfg.output_dir = out_dir;
    asm_cfg.format = req.format;
    asm_cfg.epub.width = req.transform.target_width;
    asm_cfg.epub.height = req.transform.target_height;
    asm_cfg.epub.direction = req.transform.direction;
    PackageAssembler assembler(asm_cfg, converter_);

    std::vector<VolumeArtifacts> artifacts(static_cast<size_t>(volume_count));
    [[maybe_unused]] const int workers = std::min(resolve_worker_count(config_.workers), volume_count);

#ifdef HAS_OPENMP
    #pragma omp parallel for num_threads(workers) schedule(dynamic, 1)
#endif
    for (int i = 0; i < volume_count; ++i) {
        const OutputVolume& vol = plan.volumes[static_cast<size_t>(i)];
        VolumeArtifacts& slot = artifacts[static_cast<size_t>(i)];
        if (cancel.load()) {
            slot.result = Result::fail(ErrorCode::CANCELLED, "cancelled");
            continue;
        }
        set_current_file(rec, basenames[static_cast<size_t>(i)]);
        VolumeLabel label;
        const auto& part = title_parts[static_cast<size_t>(i)];
        label.title = volume_title(meta, part.first, part.second);
        label.series_index = series_index(meta, name_indices[static_cast<size_t>(i)]);
        try {
            slot = assembler.assemble(vol, meta, label, basenames[static_cast<size_t>(i)], cancel);
        } catch (const std::exception& e) {
            slot.result = Result::fail(ErrorCode::IO_ERROR, e.what());
        }
        std::lock_guard<std::mutex> lock(rec.mutex);
        rec.progress.volume_done();
        JobStateMachine(rec.job).report_progress(rec.progress.percent());
    }
    plan.volumes.clear();

    std::vector<std::string> files;
    std::vector<std::string> warnings;
    const VolumeArtifacts* first_failure = nullptr;
    for (const auto& a : artifacts) {
        files.insert(files.end(), a.files.begin(), a.files.end());
        warnings.insert(warnings.end(), a.warnings.begin(), a.warnings.end());
        if (a.result.failure() && !first_failure) first_failure = &a;
    }
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        JobStateMachine state(rec.job);
        for (const auto& w : warnings) state.add_warning(w);
    }

    if (cancel.load() || (first_failure && first_failure->result.error == ErrorCode::CANCELLED)) {
        discard_outputs(rec, files);
        fail(rec, ErrorKind::Cancelled, "cancelled");
        return;
    }
    if (first_failure) {
        discard_outputs(rec, files);
        std::lock_guard<std::mutex> lock(rec.mutex);
        JobStateMachine(rec.job).fail(ErrorKind::Fatal, "packaging failed: " + first_failure->result.message,
                                      config_.keep_partial_output ? files : std::vector<std::string>{});
        return;
    }

    if (req.merge && volume_count > 1) {
        if (!transition(rec, JobPhase::Splitting)) {
            discard_outputs(rec, files);
            return;
        }
        for (const auto& f : files) {
            if (!fs::is_regular_file(fs::path(out_dir) / f, ec)) {
                discard_outputs(rec, files);
                fail(rec, ErrorKind::Fatal, "volume file missing: " + f);
                return;
            }
        }
    }

    std::lock_guard<std::mutex> lock(rec.mutex);
    JobStateMachine(rec.job).complete(std::move(files));
}

}
