#include "package/format_converter.hpp"
#include "util/log.hpp"
#include "util/subprocess.hpp"

#include <filesystem>

namespace panelpress {

Result DisabledConverter::convert(const std::string&, const std::string&, const std::atomic<bool>&) const {
    return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "mobi conversion is disabled");
}

ExternalCommandConverter::ExternalCommandConverter(std::string command) : command_(std::move(command)) {}

Result ExternalCommandConverter::convert(const std::string& primary_path, const std::string& legacy_path,
                                         const std::atomic<bool>& cancel) const {
    ProcessResult proc = run_process({command_, primary_path, legacy_path,
                                      "--output-profile=kindle",
                                      "--no-inline-toc",
                                      "--mobi-file-type=both"}, &cancel);
    if (proc.cancelled) {
        std::error_code ec;
        std::filesystem::remove(legacy_path, ec);
        return Result::fail(ErrorCode::CANCELLED, "cancelled");
    }
    if (!proc.launched) {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, command_ + " is not available: " + proc.output);
    }
    if (proc.exit_code != 0) {
        log::debug(command_ + " output: " + proc.output);
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR,
                            command_ + " exited with " + std::to_string(proc.exit_code));
    }
    std::error_code ec;
    if (!std::filesystem::exists(legacy_path, ec)) {
        return Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, command_ + " produced no output");
    }
    return Result::ok();
}

std::shared_ptr<FormatConverter> create_converter(bool enabled, const std::string& command) {
    if (!enabled || command.empty()) {
        return std::make_shared<DisabledConverter>();
    }
    if (!command_available(command)) {
        log::warning(command + " not found in PATH; mobi requests will fall back to epub");
    }
    return std::make_shared<ExternalCommandConverter>(command);
}

}
