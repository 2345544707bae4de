#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace panelpress {

enum class JobPhase {
    Pending,
    Extracting,
    Processing,
    Merging,
    Converting,
    Splitting,
    Completed,
    Failed
};

enum class ErrorKind {
    Page,
    Document,
    BudgetValidation,
    SecondaryFormat,
    Fatal,
    Cancelled
};

struct JobError {
    ErrorKind kind = ErrorKind::Fatal;
    std::string message;
};

struct ConversionJob {
    std::string id;
    std::string session_id;
    std::vector<std::string> source_ids;
    bool merge = false;
    size_t max_volume_bytes = 0;
    OutputFormat format = OutputFormat::Primary;

    JobPhase phase = JobPhase::Pending;
    double progress = 0.0;
    std::optional<std::string> current_file;
    std::vector<std::string> output_files;
    std::optional<JobError> error;
    std::vector<std::string> warnings;
    std::vector<std::string> failed_pages;
    int volume_count = 0;

    int64_t created_ms = 0;
    int64_t completed_ms = 0;

    bool terminal() const { return phase == JobPhase::Completed || phase == JobPhase::Failed; }
};

const char* to_string(JobPhase phase);
const char* phase_label(JobPhase phase);
const char* to_string(ErrorKind kind);

nlohmann::json to_json_value(const ConversionJob& job);
std::string to_json(const ConversionJob& job);

}
