#pragma once

#include "core/types.hpp"
#include "transform/upscaler.hpp"
#include <atomic>
#include <memory>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

namespace panelpress {

class PageTransformer {
public:
    struct Outcome {
        Result result;
        std::vector<Page> pages;
        bool upscale_fallback = false;
        std::string warning;
    };

    struct ResizePlan {
        int target_w = 0;
        int target_h = 0;
        int scale_w = 0;
        int scale_h = 0;
        int crop_x = 0;
        int crop_y = 0;
        bool resize = false;
    };

    // Fixed per-page overhead added to the encoded image size: one XHTML wrapper
    // plus manifest, spine and navigation entries.
    static constexpr size_t PAGE_OVERHEAD_BYTES = 1024;

    PageTransformer(const TransformOptions& options, std::shared_ptr<Upscaler> upscaler);

    const TransformOptions& options() const { return options_; }

    Outcome transform(const RawPage& raw, const std::string& source_id, ReadingDirection direction,
                      const std::atomic<bool>* cancel = nullptr) const;
    // Decodes, fits and encodes one standalone image, never splitting it.
    Outcome transform_single(const std::vector<uint8_t>& bytes) const;

    static bool is_spread(int width, int height, float ratio);
    // Halves in reading order: right half first for right-to-left.
    static std::pair<cv::Mat, cv::Mat> split_spread(const cv::Mat& image, ReadingDirection direction);

    ResizePlan compute_resize_plan(int src_w, int src_h) const;
    double upscale_factor(int src_w, int src_h) const;

private:
    TransformOptions options_;
    std::shared_ptr<Upscaler> upscaler_;
    LanczosUpscaler fallback_;
    const std::atomic<bool> never_cancelled_{false};

    Result finish(cv::Mat image, Page& page, Outcome& outcome, const std::atomic<bool>& cancel) const;
    Result upscale(const cv::Mat& input, cv::Mat& output, Outcome& outcome,
                   const std::atomic<bool>& cancel) const;
    Result fit(const cv::Mat& input, cv::Mat& output) const;
    Result encode(const cv::Mat& image, std::vector<uint8_t>& out) const;
};

}
