#pragma once

#include "core/types.hpp"
#include "transform/page_transformer.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace panelpress {

struct PageFailure {
    int original_index = 0;
    std::string name;
    std::string message;
};

struct DocumentTransform {
    std::string source_id;
    std::string name;
    int total_pages = 0;
    std::vector<Page> pages;
    std::vector<PageFailure> failures;
    std::vector<std::string> warnings;
    bool cancelled = false;
    // Set when the document as a whole is unusable.
    Result result;
};

class TransformStage {
public:
    struct Config {
        int workers = 0;
        float max_failure_ratio = 0.5f;
    };

    // Called from worker threads with the number of pages finished so far.
    using ProgressFn = std::function<void(int done, int total)>;

    TransformStage(const Config& config, const PageTransformer& transformer);

    DocumentTransform run(const SourceDocument& doc, const std::atomic<bool>& cancel,
                          const ProgressFn& on_page = nullptr) const;

    int worker_count() const;

private:
    Config config_;
    const PageTransformer& transformer_;
};

int resolve_worker_count(int requested);

}
