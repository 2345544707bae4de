#include "package/assembler.hpp"
#include "util/log.hpp"

#include <filesystem>

namespace panelpress {

namespace fs = std::filesystem;

PackageAssembler::PackageAssembler(const Config& config, std::shared_ptr<FormatConverter> converter)
    : config_(config), writer_(config.epub), converter_(std::move(converter)) {
    if (!converter_) {
        converter_ = std::make_shared<DisabledConverter>();
    }
}

VolumeArtifacts PackageAssembler::assemble(const OutputVolume& volume, const BookMetadata& meta,
                                           const VolumeLabel& label, const std::string& basename,
                                           const std::atomic<bool>& cancel) const {
    VolumeArtifacts out;
    const std::string epub_name = basename + ".epub";
    const std::string mobi_name = basename + ".mobi";
    const std::string epub_path = (fs::path(config_.output_dir) / epub_name).string();
    const std::string mobi_path = (fs::path(config_.output_dir) / mobi_name).string();

    if (cancel.load()) {
        out.result = Result::fail(ErrorCode::CANCELLED, "cancelled");
        return out;
    }

    out.result = writer_.write(epub_path, volume, meta, label);
    if (out.result.failure()) {
        return out;
    }
    log::debug("wrote " + epub_path + " (" + std::to_string(volume.pages.size()) + " pages)");

    if (!wants_legacy(config_.format)) {
        out.files.push_back(epub_name);
        return out;
    }

    Result converted = converter_->convert(epub_path, mobi_path, cancel);
    if (converted.error == ErrorCode::CANCELLED) {
        out.result = converted;
        std::error_code ec;
        fs::remove(epub_path, ec);
        return out;
    }
    if (converted.failure()) {
        std::string msg = "mobi conversion failed for " + epub_name + ": " + converted.message + "; epub kept";
        log::warning(msg);
        out.warnings.push_back(msg);
        out.files.push_back(epub_name);
        return out;
    }

    if (config_.format == OutputFormat::Legacy) {
        std::error_code ec;
        fs::remove(epub_path, ec);
        out.files.push_back(mobi_name);
    } else {
        out.files.push_back(epub_name);
        out.files.push_back(mobi_name);
    }
    return out;
}

}
