#include "transform/transform_stage.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <thread>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace panelpress {

int resolve_worker_count(int requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
}

TransformStage::TransformStage(const Config& config, const PageTransformer& transformer)
    : config_(config), transformer_(transformer) {}

int TransformStage::worker_count() const {
    return resolve_worker_count(config_.workers);
}

DocumentTransform TransformStage::run(const SourceDocument& doc, const std::atomic<bool>& cancel,
                                      const ProgressFn& on_page) const {
    DocumentTransform out;
    out.source_id = doc.id;
    out.name = doc.name;
    out.total_pages = static_cast<int>(doc.pages.size());

    if (doc.pages.empty()) {
        out.result = Result::fail(ErrorCode::INVALID_ARGUMENT, "document " + doc.name + " has no pages");
        return out;
    }

    const int n = out.total_pages;
    // One slot per original page; workers only write their own slot.
    std::vector<PageTransformer::Outcome> slots(static_cast<size_t>(n));
    std::vector<char> skipped(static_cast<size_t>(n), 0);
    std::atomic<int> done{0};

    [[maybe_unused]] const int workers = std::min(worker_count(), n);

#ifdef HAS_OPENMP
    #pragma omp parallel for num_threads(workers) schedule(dynamic, 1)
#endif
    for (int i = 0; i < n; ++i) {
        if (cancel.load()) {
            skipped[static_cast<size_t>(i)] = 1;
            continue;
        }
        slots[static_cast<size_t>(i)] = transformer_.transform(doc.pages[static_cast<size_t>(i)], doc.id,
                                                               doc.direction, &cancel);
        int finished = done.fetch_add(1) + 1;
        if (on_page) {
            on_page(finished, n);
        }
    }

    if (cancel.load()) {
        out.cancelled = true;
        out.result = Result::fail(ErrorCode::CANCELLED, "cancelled");
        return out;
    }

    for (int i = 0; i < n; ++i) {
        auto& slot = slots[static_cast<size_t>(i)];
        const RawPage& raw = doc.pages[static_cast<size_t>(i)];
        if (slot.result.failure()) {
            out.failures.push_back({raw.index, raw.name, slot.result.message});
            log::warning("page " + raw.name + " of " + doc.name + " failed: " + slot.result.message);
            continue;
        }
        if (!slot.warning.empty()) {
            out.warnings.push_back(raw.name + ": " + slot.warning);
        }
        for (auto& page : slot.pages) {
            out.pages.push_back(std::move(page));
        }
    }

    int failed = static_cast<int>(out.failures.size());
    if (failed == n) {
        out.result = Result::fail(ErrorCode::PROCESSING_ERROR,
                                  "document " + doc.name + ": no page could be converted");
    } else if (static_cast<float>(failed) / static_cast<float>(n) > config_.max_failure_ratio) {
        out.result = Result::fail(ErrorCode::PROCESSING_ERROR,
                                  "document " + doc.name + ": " + std::to_string(failed) + " of " +
                                  std::to_string(n) + " pages failed");
    }
    if (out.result.failure()) {
        out.pages.clear();
    }
    return out;
}

}
