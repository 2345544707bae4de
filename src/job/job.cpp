#include "job/job.hpp"
#include "util/text.hpp"

#include <cmath>

namespace panelpress {

const char* to_string(JobPhase phase) {
    switch (phase) {
        case JobPhase::Pending: return "pending";
        case JobPhase::Extracting: return "extracting";
        case JobPhase::Processing: return "processing";
        case JobPhase::Merging: return "merging";
        case JobPhase::Converting: return "converting";
        case JobPhase::Splitting: return "splitting";
        case JobPhase::Completed: return "completed";
        case JobPhase::Failed: return "failed";
    }
    return "pending";
}

const char* phase_label(JobPhase phase) {
    switch (phase) {
        case JobPhase::Pending: return "Waiting to start";
        case JobPhase::Extracting: return "Reading source pages";
        case JobPhase::Processing: return "Processing images";
        case JobPhase::Merging: return "Merging documents";
        case JobPhase::Converting: return "Building ebook files";
        case JobPhase::Splitting: return "Finalizing volumes";
        case JobPhase::Completed: return "Done";
        case JobPhase::Failed: return "Failed";
    }
    return "";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Page: return "page";
        case ErrorKind::Document: return "document";
        case ErrorKind::BudgetValidation: return "budget_validation";
        case ErrorKind::SecondaryFormat: return "secondary_format";
        case ErrorKind::Fatal: return "fatal";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "fatal";
}

nlohmann::json to_json_value(const ConversionJob& job) {
    nlohmann::json j;
    j["job_id"] = job.id;
    j["session_id"] = job.session_id;
    j["status"] = to_string(job.phase);
    j["phase_label"] = phase_label(job.phase);
    j["progress"] = std::round(job.progress * 10.0) / 10.0;
    j["current_file"] = job.current_file ? nlohmann::json(*job.current_file) : nlohmann::json(nullptr);
    j["sources"] = job.source_ids;
    j["merge"] = job.merge;
    j["max_volume_bytes"] = job.max_volume_bytes;
    j["format"] = to_string(job.format);
    j["output_files"] = job.output_files;
    j["volume_count"] = job.volume_count;
    j["warnings"] = job.warnings;
    j["failed_pages"] = job.failed_pages;
    if (job.error) {
        j["error"] = {{"kind", to_string(job.error->kind)}, {"message", job.error->message}};
    } else {
        j["error"] = nullptr;
    }
    j["created_at"] = iso8601_utc(job.created_ms);
    j["completed_at"] = job.completed_ms > 0 ? nlohmann::json(iso8601_utc(job.completed_ms))
                                             : nlohmann::json(nullptr);
    return j;
}

// Names and messages can carry bytes from upload filenames; invalid UTF-8 becomes U+FFFD.
std::string to_json(const ConversionJob& job) {
    return to_json_value(job).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
