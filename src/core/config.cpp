#include "core/config.hpp"
#include "core/device_profiles.hpp"
#include "cli/args.hpp"
#include "util/log.hpp"
#include <toml.hpp>

#include <filesystem>
#include <cstdlib>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace panelpress {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/panelpress";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (storage.output_dir.empty()) {
        error = "storage.output_dir must not be empty";
        return false;
    }
    if (pipeline.workers < 0 || pipeline.workers > 256) {
        error = "pipeline.workers must be between 0 and 256";
        return false;
    }
    if (pipeline.jpeg_quality < 1 || pipeline.jpeg_quality > 100) {
        error = "pipeline.jpeg_quality must be between 1 and 100";
        return false;
    }
    if (pipeline.spread_ratio < 1.0f || pipeline.spread_ratio > 4.0f) {
        error = "pipeline.spread_ratio must be between 1.0 and 4.0";
        return false;
    }
    if (pipeline.max_failure_ratio < 0.0f || pipeline.max_failure_ratio > 1.0f) {
        error = "pipeline.max_failure_ratio must be between 0.0 and 1.0";
        return false;
    }
    if (!is_known_device(device.profile)) {
        error = "device.profile '" + device.profile + "' is not a known device";
        return false;
    }
    if (device.width < 0 || device.width > 10000 || device.height < 0 || device.height > 10000) {
        error = "device.width and device.height must be between 0 and 10000";
        return false;
    }
    if ((device.width > 0) != (device.height > 0)) {
        error = "device.width and device.height must be set together";
        return false;
    }
    ReadingDirection direction;
    if (!parse_reading_direction(device.reading_direction, direction)) {
        error = "device.reading_direction must be 'rtl' or 'ltr'";
        return false;
    }
    UpscaleMethod method;
    if (!parse_upscale_method(upscale.method, method)) {
        error = "upscale.method must be 'none', 'lanczos' or 'external'";
        return false;
    }
    if (upscale.scale < 2 || upscale.scale > 4) {
        error = "upscale.scale must be 2, 3 or 4";
        return false;
    }
    if (method == UpscaleMethod::External && upscale.command.empty()) {
        error = "upscale.command must be set for the external upscaler";
        return false;
    }
    OutputFormat format;
    if (!parse_output_format(output.format, format)) {
        error = "output.format must be 'epub', 'mobi' or 'both'";
        return false;
    }
    if (output.max_volume_mb < 1 || output.max_volume_mb > 4096) {
        error = "output.max_volume_mb must be between 1 and 4096";
        return false;
    }
    if (output.naming_pattern.empty()) {
        error = "output.naming_pattern must not be empty";
        return false;
    }
    if (output.language.empty()) {
        error = "output.language must not be empty";
        return false;
    }
    if (convert.enabled && convert.command.empty() && format != OutputFormat::Primary) {
        error = "convert.command must be set when mobi output is requested";
        return false;
    }
    return true;
}

TransformOptions Config::transform_options() const {
    TransformOptions opts;
    Size target = resolve_target_size(device.profile, device.width, device.height);
    opts.target_width = target.width;
    opts.target_height = target.height;
    parse_upscale_method(upscale.method, opts.upscale);
    opts.detect_spreads = device.detect_spreads;
    opts.rotate_spreads = device.rotate_spreads;
    opts.fill_screen = device.fill_screen;
    parse_reading_direction(device.reading_direction, opts.direction);
    opts.jpeg_quality = pipeline.jpeg_quality;
    opts.spread_ratio = pipeline.spread_ratio;
    return opts;
}

size_t Config::max_volume_bytes() const {
    return static_cast<size_t>(output.max_volume_mb) * 1024 * 1024;
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                log::warning("config " + path + " has version " + std::to_string(*v) +
                             ", expected " + std::to_string(CONFIG_VERSION));
                return std::nullopt;
            }
        }

        if (auto storage = tbl["storage"]) {
            if (auto v = storage["upload_dir"].value<std::string>()) cfg.storage.upload_dir = *v;
            if (auto v = storage["output_dir"].value<std::string>()) cfg.storage.output_dir = *v;
            if (auto v = storage["keep_partial_output"].value<bool>()) cfg.storage.keep_partial_output = *v;
        }

        if (auto pipeline = tbl["pipeline"]) {
            if (auto v = pipeline["workers"].value<int>()) cfg.pipeline.workers = *v;
            if (auto v = pipeline["jpeg_quality"].value<int>()) cfg.pipeline.jpeg_quality = *v;
            if (auto v = pipeline["spread_ratio"].value<double>()) cfg.pipeline.spread_ratio = static_cast<float>(*v);
            if (auto v = pipeline["max_failure_ratio"].value<double>()) cfg.pipeline.max_failure_ratio = static_cast<float>(*v);
            if (auto v = pipeline["allow_partial"].value<bool>()) cfg.pipeline.allow_partial = *v;
        }

        if (auto device = tbl["device"]) {
            if (auto v = device["profile"].value<std::string>()) cfg.device.profile = *v;
            if (auto v = device["width"].value<int>()) cfg.device.width = *v;
            if (auto v = device["height"].value<int>()) cfg.device.height = *v;
            if (auto v = device["detect_spreads"].value<bool>()) cfg.device.detect_spreads = *v;
            if (auto v = device["rotate_spreads"].value<bool>()) cfg.device.rotate_spreads = *v;
            if (auto v = device["fill_screen"].value<bool>()) cfg.device.fill_screen = *v;
            if (auto v = device["reading_direction"].value<std::string>()) cfg.device.reading_direction = *v;
        }

        if (auto upscale = tbl["upscale"]) {
            if (auto v = upscale["method"].value<std::string>()) cfg.upscale.method = *v;
            if (auto v = upscale["command"].value<std::string>()) cfg.upscale.command = *v;
            if (auto v = upscale["scale"].value<int>()) cfg.upscale.scale = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["format"].value<std::string>()) cfg.output.format = *v;
            if (auto v = output["max_volume_mb"].value<int>()) cfg.output.max_volume_mb = *v;
            if (auto v = output["naming_pattern"].value<std::string>()) cfg.output.naming_pattern = *v;
            if (auto v = output["language"].value<std::string>()) cfg.output.language = *v;
        }

        if (auto convert = tbl["convert"]) {
            if (auto v = convert["command"].value<std::string>()) cfg.convert.command = *v;
            if (auto v = convert["enabled"].value<bool>()) cfg.convert.enabled = *v;
        }

        if (auto logt = tbl["log"]) {
            if (auto v = logt["file"].value<std::string>()) cfg.log.file = *v;
            if (auto v = logt["verbose"].value<bool>()) cfg.log.verbose = *v;
        }

        std::string error;
        if (!cfg.validate(error)) {
            log::warning("config " + path + ": " + error);
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        log::warning("config " + path + ": " + std::string(e.description()));
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config d = Config::defaults();

    if (override.storage.upload_dir != d.storage.upload_dir) result.storage.upload_dir = override.storage.upload_dir;
    if (override.storage.output_dir != d.storage.output_dir) result.storage.output_dir = override.storage.output_dir;
    if (override.storage.keep_partial_output != d.storage.keep_partial_output)
        result.storage.keep_partial_output = override.storage.keep_partial_output;

    if (override.pipeline.workers != d.pipeline.workers) result.pipeline.workers = override.pipeline.workers;
    if (override.pipeline.jpeg_quality != d.pipeline.jpeg_quality) result.pipeline.jpeg_quality = override.pipeline.jpeg_quality;
    if (override.pipeline.spread_ratio != d.pipeline.spread_ratio) result.pipeline.spread_ratio = override.pipeline.spread_ratio;
    if (override.pipeline.max_failure_ratio != d.pipeline.max_failure_ratio)
        result.pipeline.max_failure_ratio = override.pipeline.max_failure_ratio;
    if (override.pipeline.allow_partial != d.pipeline.allow_partial) result.pipeline.allow_partial = override.pipeline.allow_partial;

    if (override.device.profile != d.device.profile) result.device.profile = override.device.profile;
    if (override.device.width != 0) result.device.width = override.device.width;
    if (override.device.height != 0) result.device.height = override.device.height;
    if (override.device.detect_spreads != d.device.detect_spreads) result.device.detect_spreads = override.device.detect_spreads;
    if (override.device.rotate_spreads != d.device.rotate_spreads) result.device.rotate_spreads = override.device.rotate_spreads;
    if (override.device.fill_screen != d.device.fill_screen) result.device.fill_screen = override.device.fill_screen;
    if (override.device.reading_direction != d.device.reading_direction)
        result.device.reading_direction = override.device.reading_direction;

    if (override.upscale.method != d.upscale.method) result.upscale.method = override.upscale.method;
    if (override.upscale.command != d.upscale.command) result.upscale.command = override.upscale.command;
    if (override.upscale.scale != d.upscale.scale) result.upscale.scale = override.upscale.scale;

    if (override.output.format != d.output.format) result.output.format = override.output.format;
    if (override.output.max_volume_mb != d.output.max_volume_mb) result.output.max_volume_mb = override.output.max_volume_mb;
    if (override.output.naming_pattern != d.output.naming_pattern) result.output.naming_pattern = override.output.naming_pattern;
    if (override.output.language != d.output.language) result.output.language = override.output.language;

    if (override.convert.command != d.convert.command) result.convert.command = override.convert.command;
    if (override.convert.enabled != d.convert.enabled) result.convert.enabled = override.convert.enabled;

    if (!override.log.file.empty()) result.log.file = override.log.file;
    if (override.log.verbose) result.log.verbose = true;

    if (!override.config_path.empty()) result.config_path = override.config_path;
    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.device.empty()) config.device.profile = args.device;
    if (args.width > 0) config.device.width = args.width;
    if (args.height > 0) config.device.height = args.height;
    if (args.width > 0 && args.height > 0 && args.device.empty()) config.device.profile = CUSTOM_DEVICE;
    if (args.no_spreads) config.device.detect_spreads = false;
    if (args.rotate_spreads) config.device.rotate_spreads = true;
    if (args.fill) config.device.fill_screen = true;
    if (args.ltr) config.device.reading_direction = "ltr";

    if (!args.upscale.empty()) config.upscale.method = args.upscale;
    if (!args.format.empty()) config.output.format = args.format;
    if (args.max_size_mb > 0) config.output.max_volume_mb = args.max_size_mb;
    if (!args.naming.empty()) config.output.naming_pattern = args.naming;
    if (!args.output_dir.empty()) config.storage.output_dir = args.output_dir;

    if (args.workers >= 0) config.pipeline.workers = args.workers;
    if (args.quality > 0) config.pipeline.jpeg_quality = args.quality;
    if (args.verbose) config.log.verbose = true;

    return config;
}

}
