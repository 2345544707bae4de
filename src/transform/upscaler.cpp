#include "transform/upscaler.hpp"
#include "util/subprocess.hpp"
#include "util/text.hpp"

#include <cmath>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace panelpress {

namespace fs = std::filesystem;

namespace {
constexpr int MAX_PASSES = 4;
}

Result LanczosUpscaler::upscale(const cv::Mat& input, double scale, cv::Mat& output,
                                const std::atomic<bool>&) const {
    if (input.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "empty image");
    }
    if (scale <= 1.0) {
        output = input;
        return Result::ok();
    }
    int w = static_cast<int>(std::ceil(input.cols * scale));
    int h = static_cast<int>(std::ceil(input.rows * scale));
    try {
        cv::resize(input, output, cv::Size(w, h), 0, 0, cv::INTER_LANCZOS4);
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, std::string("lanczos resize failed: ") + e.what());
    }
    return Result::ok();
}

ExternalUpscaler::ExternalUpscaler(const Config& config) : config_(config) {
    if (config_.temp_dir.empty()) {
        config_.temp_dir = fs::temp_directory_path().string();
    }
}

Result ExternalUpscaler::upscale(const cv::Mat& input, double scale, cv::Mat& output,
                                 const std::atomic<bool>& cancel) const {
    if (input.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "empty image");
    }
    if (scale <= 1.0) {
        output = input;
        return Result::ok();
    }

    std::error_code ec;
    fs::path work = fs::path(config_.temp_dir) / ("panelpress-upscale-" + make_id());
    fs::create_directories(work, ec);
    if (ec) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot create " + work.string() + ": " + ec.message());
    }

    Result result = Result::ok();
    cv::Mat current = input;
    double reached = 1.0;
    int pass = 0;
    while (reached < scale && pass < MAX_PASSES) {
        if (cancel.load()) {
            result = Result::fail(ErrorCode::CANCELLED, "cancelled");
            break;
        }
        std::string in_path = (work / ("in" + std::to_string(pass) + ".png")).string();
        std::string out_path = (work / ("out" + std::to_string(pass) + ".png")).string();
        try {
            if (!cv::imwrite(in_path, current)) {
                result = Result::fail(ErrorCode::IO_ERROR, "cannot write " + in_path);
                break;
            }
        } catch (const cv::Exception& e) {
            result = Result::fail(ErrorCode::IO_ERROR, std::string("cannot write upscale input: ") + e.what());
            break;
        }

        ProcessResult proc = run_process({config_.command, "-i", in_path, "-o", out_path,
                                          "-s", std::to_string(config_.model_scale)}, &cancel);
        if (proc.cancelled) {
            result = Result::fail(ErrorCode::CANCELLED, "cancelled");
            break;
        }
        if (!proc.launched) {
            result = Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "upscaler not available: " + proc.output);
            break;
        }
        if (proc.exit_code != 0) {
            result = Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR,
                                  "upscaler exited with " + std::to_string(proc.exit_code));
            break;
        }
        cv::Mat enlarged = cv::imread(out_path, cv::IMREAD_COLOR);
        if (enlarged.empty() || enlarged.cols <= current.cols) {
            result = Result::fail(ErrorCode::EXTERNAL_TOOL_ERROR, "upscaler produced no usable image");
            break;
        }
        reached *= static_cast<double>(enlarged.cols) / current.cols;
        current = enlarged;
        ++pass;
    }

    fs::remove_all(work, ec);
    if (result.success()) {
        output = current;
    }
    return result;
}

std::shared_ptr<Upscaler> create_upscaler(UpscaleMethod method, const ExternalUpscaler::Config& external) {
    switch (method) {
        case UpscaleMethod::Lanczos:
            return std::make_shared<LanczosUpscaler>();
        case UpscaleMethod::External:
            return std::make_shared<ExternalUpscaler>(external);
        default:
            return nullptr;
    }
}

}
