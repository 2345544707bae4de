#include "core/types.hpp"
#include "core/config.hpp"
#include "core/device_profiles.hpp"
#include "job/coordinator.hpp"
#include "job/job.hpp"
#include "package/format_converter.hpp"
#include "source/page_source.hpp"
#include "util/log.hpp"
#include "util/text.hpp"
#include "cli/args.hpp"

#include <chrono>
#include <thread>
#include <iostream>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace {

constexpr const char* CLI_SESSION = "cli";

void list_devices() {
    printf("%-22s %-28s %6s x %-6s %s\n", "ID", "NAME", "WIDTH", "HEIGHT", "FORMAT");
    for (const auto& p : panelpress::device_profiles()) {
        printf("%-22s %-28s %6d x %-6d %s\n", p.id.c_str(), p.name.c_str(),
               p.width, p.height, panelpress::to_string(p.recommended));
    }
}

std::string source_id_for(size_t position) {
    char buf[16];
    snprintf(buf, sizeof(buf), "doc%02zu", position + 1);
    return buf;
}

void print_status(const panelpress::ConversionJob& job, bool json) {
    if (json) {
        std::cout << panelpress::to_json(job) << std::endl;
        return;
    }
    std::cerr << "\r[" << static_cast<int>(job.progress) << "%] "
              << panelpress::phase_label(job.phase);
    if (job.current_file) std::cerr << " - " << *job.current_file;
    std::cerr << "\033[K" << std::flush;
}

}  // namespace

int main(int argc, char* argv[]) {
    panelpress::Args args = panelpress::parse_args(argc, argv);

    if (args.show_help) {
        panelpress::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        return 1;
    }
    if (args.list_devices) {
        list_devices();
        return 0;
    }

    panelpress::Config config = panelpress::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = panelpress::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = panelpress::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = panelpress::Config::load_default()) {
            config = panelpress::merge_config(config, *loaded_default);
        }
    }
    config = panelpress::apply_cli_overrides(config, args);

    if (args.sources.empty()) {
        std::cerr << "Error: No input specified\n";
        panelpress::print_help(argv[0]);
        return 1;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    panelpress::log::init(config.log.file, config.log.verbose);

    panelpress::TransformOptions transform = config.transform_options();

    std::shared_ptr<panelpress::SourceProvider> sources;
    std::shared_ptr<panelpress::MemorySourceProvider> memory_sources;
    panelpress::ConversionRequest request;
    if (!args.session.empty()) {
        sources = std::make_shared<panelpress::DirectorySourceProvider>(config.storage.upload_dir,
                                                                        transform.direction);
        request.session_id = args.session;
        request.source_ids = args.sources;
    } else {
        memory_sources = std::make_shared<panelpress::MemorySourceProvider>();
        sources = memory_sources;
        request.session_id = CLI_SESSION;
        for (size_t i = 0; i < args.sources.size(); ++i) {
            std::string id = source_id_for(i);
            auto result = memory_sources->add_directory(CLI_SESSION, id, args.sources[i], transform.direction);
            if (result.failure()) {
                std::cerr << "Error: " << args.sources[i] << ": " << result.message << "\n";
                panelpress::log::close();
                return 1;
            }
            request.source_ids.push_back(id);
        }
    }

    request.transform = transform;
    request.merge = args.merge;
    request.max_volume_bytes = config.max_volume_bytes();
    panelpress::parse_output_format(config.output.format, request.format);
    request.naming_pattern = config.output.naming_pattern;

    panelpress::BookMetadata& meta = request.metadata;
    meta.title = args.title.empty() ? fs::path(args.sources.front()).filename().string() : args.title;
    if (meta.title.empty()) meta.title = args.sources.front();
    meta.author = args.author;
    meta.series = args.series;
    meta.description = args.description;
    meta.language = config.output.language;
    meta.chapter = args.chapter;
    meta.volume = args.volume;
    if (!args.cover_path.empty()) {
        std::vector<uint8_t> cover;
        if (!panelpress::read_file(args.cover_path, cover)) {
            std::cerr << "Error: Failed to read cover: " << args.cover_path << "\n";
            panelpress::log::close();
            return 1;
        }
        meta.cover = std::move(cover);
    }

    panelpress::JobCoordinator::Config coord_cfg;
    coord_cfg.output_dir = config.storage.output_dir;
    coord_cfg.workers = config.pipeline.workers;
    coord_cfg.max_failure_ratio = config.pipeline.max_failure_ratio;
    coord_cfg.allow_partial = config.pipeline.allow_partial;
    coord_cfg.keep_partial_output = config.storage.keep_partial_output;
    coord_cfg.upscaler.command = config.upscale.command;
    coord_cfg.upscaler.model_scale = config.upscale.scale;

    auto converter = panelpress::create_converter(config.convert.enabled, config.convert.command);
    panelpress::JobCoordinator coordinator(coord_cfg, sources, converter);

    auto submitted = coordinator.submit(request);
    if (submitted.result.failure()) {
        std::cerr << "Error: " << panelpress::to_string(submitted.rejection) << ": "
                  << submitted.result.message << "\n";
        panelpress::log::close();
        return 1;
    }

    const std::string job_id = submitted.job.id;
    panelpress::ConversionJob job = submitted.job;
    double last_progress = -1.0;
    panelpress::JobPhase last_phase = job.phase;
    while (true) {
        auto current = coordinator.status(job_id);
        if (!current) break;
        job = *current;
        if (job.progress != last_progress || job.phase != last_phase) {
            print_status(job, args.status_json);
            last_progress = job.progress;
            last_phase = job.phase;
        }
        if (job.terminal()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (!args.status_json) std::cerr << "\n";
    // Page bytes are no longer needed once the job is terminal.
    if (memory_sources) memory_sources->remove_session(CLI_SESSION);

    for (const auto& w : job.warnings) {
        std::cerr << "Warning: " << w << "\n";
    }

    if (job.phase != panelpress::JobPhase::Completed) {
        std::string message = job.error ? job.error->message : "job did not complete";
        std::cerr << "Error: " << message << "\n";
        panelpress::log::close();
        return 1;
    }

    const std::string dir = coordinator.job_dir(request.session_id, job_id);
    for (const auto& file : job.output_files) {
        std::cout << (fs::path(dir) / file).string() << "\n";
    }

    if (!args.bundle_path.empty()) {
        auto result = coordinator.bundle(job_id, args.bundle_path);
        if (result.failure()) {
            std::cerr << "Error: Failed to write bundle: " << result.message << "\n";
            panelpress::log::close();
            return 1;
        }
        std::cout << args.bundle_path << "\n";
    }

    panelpress::log::close();
    return 0;
}
