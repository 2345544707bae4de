#pragma once

#include "core/types.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace panelpress {

constexpr int CONFIG_VERSION = 1;

struct ConfigStorage {
    std::string upload_dir = "./.data/uploads";
    std::string output_dir = "./.data/output";
    bool keep_partial_output = false;
};

struct ConfigPipeline {
    int workers = 0;
    int jpeg_quality = 85;
    float spread_ratio = 1.3f;
    float max_failure_ratio = 0.5f;
    bool allow_partial = true;
};

struct ConfigDevice {
    std::string profile = "kindle_paperwhite_5";
    int width = 0;
    int height = 0;
    bool detect_spreads = true;
    bool rotate_spreads = false;
    bool fill_screen = false;
    std::string reading_direction = "rtl";
};

struct ConfigUpscale {
    std::string method = "none";
    std::string command = "realesrgan-ncnn-vulkan";
    int scale = 2;
};

struct ConfigOutput {
    std::string format = "epub";
    int max_volume_mb = 200;
    std::string naming_pattern = "{series} - Chapter {index:03d}";
    std::string language = "en";
};

struct ConfigConvert {
    std::string command = "ebook-convert";
    bool enabled = true;
};

struct ConfigLog {
    std::string file;
    bool verbose = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigStorage storage;
    ConfigPipeline pipeline;
    ConfigDevice device;
    ConfigUpscale upscale;
    ConfigOutput output;
    ConfigConvert convert;
    ConfigLog log;

    std::string config_path;

    bool validate(std::string& error) const;

    // Resolves the device profile and the custom dimensions into job options.
    TransformOptions transform_options() const;
    size_t max_volume_bytes() const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
