#include "transform/page_transformer.hpp"
#include "source/page_source.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace panelpress {

PageTransformer::PageTransformer(const TransformOptions& options, std::shared_ptr<Upscaler> upscaler)
    : options_(options), upscaler_(std::move(upscaler)) {}

bool PageTransformer::is_spread(int width, int height, float ratio) {
    if (width <= 0 || height <= 0) return false;
    return static_cast<double>(width) > static_cast<double>(height) * ratio;
}

std::pair<cv::Mat, cv::Mat> PageTransformer::split_spread(const cv::Mat& image, ReadingDirection direction) {
    int left_w = image.cols / 2;
    cv::Mat left = image(cv::Rect(0, 0, left_w, image.rows)).clone();
    cv::Mat right = image(cv::Rect(left_w, 0, image.cols - left_w, image.rows)).clone();
    if (direction == ReadingDirection::RightToLeft) {
        return {right, left};
    }
    return {left, right};
}

double PageTransformer::upscale_factor(int src_w, int src_h) const {
    if (src_w <= 0 || src_h <= 0) return 1.0;
    if (src_w >= options_.target_width && src_h >= options_.target_height) return 1.0;
    double sx = static_cast<double>(options_.target_width) / src_w;
    double sy = static_cast<double>(options_.target_height) / src_h;
    return std::max(1.0, std::max(sx, sy));
}

PageTransformer::ResizePlan PageTransformer::compute_resize_plan(int src_w, int src_h) const {
    ResizePlan plan;
    plan.target_w = options_.target_width;
    plan.target_h = options_.target_height;
    plan.scale_w = src_w;
    plan.scale_h = src_h;
    if (src_w <= 0 || src_h <= 0) return plan;

    double sx = static_cast<double>(plan.target_w) / src_w;
    double sy = static_cast<double>(plan.target_h) / src_h;

    if (options_.fill_screen) {
        double s = std::max(sx, sy);
        plan.scale_w = std::max(plan.target_w, static_cast<int>(std::lround(src_w * s)));
        plan.scale_h = std::max(plan.target_h, static_cast<int>(std::lround(src_h * s)));
        plan.crop_x = (plan.scale_w - plan.target_w) / 2;
        plan.crop_y = (plan.scale_h - plan.target_h) / 2;
        plan.resize = plan.scale_w != src_w || plan.scale_h != src_h;
        return plan;
    }

    if (src_w <= plan.target_w && src_h <= plan.target_h) {
        return plan;
    }
    double s = std::min(sx, sy);
    plan.scale_w = std::clamp(static_cast<int>(std::floor(src_w * s + 1e-6)), 1, plan.target_w);
    plan.scale_h = std::clamp(static_cast<int>(std::floor(src_h * s + 1e-6)), 1, plan.target_h);
    plan.resize = true;
    return plan;
}

Result PageTransformer::upscale(const cv::Mat& input, cv::Mat& output, Outcome& outcome,
                                const std::atomic<bool>& cancel) const {
    double factor = upscale_factor(input.cols, input.rows);
    if (!upscaler_ || options_.upscale == UpscaleMethod::None || factor <= 1.0) {
        output = input;
        return Result::ok();
    }
    Result r = upscaler_->upscale(input, factor, output, cancel);
    if (r.success() || r.error == ErrorCode::CANCELLED) return r;

    outcome.upscale_fallback = true;
    outcome.warning = std::string(upscaler_->name()) + " upscaler failed (" + r.message + "), used lanczos";
    return fallback_.upscale(input, factor, output, cancel);
}

Result PageTransformer::fit(const cv::Mat& input, cv::Mat& output) const {
    ResizePlan plan = compute_resize_plan(input.cols, input.rows);
    if (!plan.resize) {
        output = input;
    } else {
        bool shrinking = plan.scale_w < input.cols;
        cv::resize(input, output, cv::Size(plan.scale_w, plan.scale_h), 0, 0,
                   shrinking ? cv::INTER_AREA : cv::INTER_LANCZOS4);
    }
    if (options_.fill_screen) {
        output = output(cv::Rect(plan.crop_x, plan.crop_y, plan.target_w, plan.target_h)).clone();
    }
    return Result::ok();
}

Result PageTransformer::encode(const cv::Mat& image, std::vector<uint8_t>& out) const {
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, options_.jpeg_quality};
    if (!cv::imencode(".jpg", image, out, params) || out.empty()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "jpeg encode failed");
    }
    return Result::ok();
}

Result PageTransformer::finish(cv::Mat image, Page& page, Outcome& outcome,
                               const std::atomic<bool>& cancel) const {
    page.source_size = {image.cols, image.rows};
    cv::Mat enlarged;
    Result r = upscale(image, enlarged, outcome, cancel);
    if (r.failure()) return r;
    cv::Mat fitted;
    r = fit(enlarged, fitted);
    if (r.failure()) return r;
    r = encode(fitted, page.data);
    if (r.failure()) return r;
    page.size = {fitted.cols, fitted.rows};
    page.estimated_bytes = page.data.size() + PAGE_OVERHEAD_BYTES;
    return Result::ok();
}

PageTransformer::Outcome PageTransformer::transform(const RawPage& raw, const std::string& source_id,
                                                    ReadingDirection direction,
                                                    const std::atomic<bool>* cancel) const {
    const std::atomic<bool>& stop = cancel ? *cancel : never_cancelled_;
    Outcome outcome;
    std::vector<uint8_t> bytes;
    outcome.result = load_page_bytes(raw, bytes);
    if (outcome.result.failure()) return outcome;

    try {
        cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
        bytes.clear();
        bytes.shrink_to_fit();
        if (image.empty()) {
            outcome.result = Result::fail(ErrorCode::INVALID_FORMAT, "cannot decode " + raw.name);
            return outcome;
        }

        Page base;
        base.source_id = source_id;
        base.original_index = raw.index;
        base.raw_byte_size = raw.byte_size;

        if (options_.detect_spreads && is_spread(image.cols, image.rows, options_.spread_ratio)) {
            auto halves = split_spread(image, direction);
            image.release();
            cv::Mat parts[2] = {halves.first, halves.second};
            for (int i = 0; i < 2; ++i) {
                Page page = base;
                page.part = i;
                page.is_spread = true;
                page.raw_byte_size = raw.byte_size / 2 + (i == 0 ? raw.byte_size % 2 : 0);
                if (options_.rotate_spreads) {
                    cv::rotate(parts[i], parts[i], cv::ROTATE_90_CLOCKWISE);
                }
                outcome.result = finish(parts[i], page, outcome, stop);
                if (outcome.result.failure()) {
                    outcome.pages.clear();
                    return outcome;
                }
                outcome.pages.push_back(std::move(page));
            }
            return outcome;
        }

        Page page = base;
        outcome.result = finish(image, page, outcome, stop);
        if (outcome.result.success()) {
            outcome.pages.push_back(std::move(page));
        }
    } catch (const cv::Exception& e) {
        outcome.pages.clear();
        outcome.result = Result::fail(ErrorCode::PROCESSING_ERROR, raw.name + ": " + e.what());
    }
    return outcome;
}

PageTransformer::Outcome PageTransformer::transform_single(const std::vector<uint8_t>& bytes) const {
    Outcome outcome;
    try {
        cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
        if (image.empty()) {
            outcome.result = Result::fail(ErrorCode::INVALID_FORMAT, "cannot decode image");
            return outcome;
        }
        Page page;
        page.raw_byte_size = bytes.size();
        outcome.result = finish(image, page, outcome, never_cancelled_);
        if (outcome.result.success()) {
            outcome.pages.push_back(std::move(page));
        }
    } catch (const cv::Exception& e) {
        outcome.result = Result::fail(ErrorCode::PROCESSING_ERROR, e.what());
    }
    return outcome;
}

}
