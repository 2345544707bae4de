#pragma once

#include "core/types.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <opencv2/core.hpp>

namespace panelpress {

class Upscaler {
public:
    virtual ~Upscaler() = default;
    // Enlarges input by at least `scale`; output may be larger than requested.
    // Returns CANCELLED once cancel is set.
    virtual Result upscale(const cv::Mat& input, double scale, cv::Mat& output,
                           const std::atomic<bool>& cancel) const = 0;
    virtual const char* name() const = 0;
};

class LanczosUpscaler : public Upscaler {
public:
    Result upscale(const cv::Mat& input, double scale, cv::Mat& output,
                   const std::atomic<bool>& cancel) const override;
    const char* name() const override { return "lanczos"; }
};

// Runs `<command> -i <in.png> -o <out.png> -s <model_scale>`, repeating the model
// until the requested scale is reached.
class ExternalUpscaler : public Upscaler {
public:
    struct Config {
        std::string command = "realesrgan-ncnn-vulkan";
        int model_scale = 2;
        std::string temp_dir;
    };

    explicit ExternalUpscaler(const Config& config);

    Result upscale(const cv::Mat& input, double scale, cv::Mat& output,
                   const std::atomic<bool>& cancel) const override;
    const char* name() const override { return "external"; }

private:
    Config config_;
};

std::shared_ptr<Upscaler> create_upscaler(UpscaleMethod method, const ExternalUpscaler::Config& external);

}
