#pragma once

#include "core/types.hpp"
#include "plan/size_estimator.hpp"
#include <string>
#include <utility>
#include <vector>

namespace panelpress {

struct PlanningDocument {
    std::string source_id;
    std::string name;
    std::vector<Page> pages;
};

class VolumePlanner {
public:
    struct Config {
        bool merge = false;
        size_t max_volume_bytes = 200ull * 1024 * 1024;
    };

    struct Plan {
        std::vector<OutputVolume> volumes;
        std::vector<std::string> warnings;
    };

    VolumePlanner(const Config& config, const SizeEstimator& estimator);

    // Consumes the documents; pages move into the returned volumes.
    Plan plan(std::vector<PlanningDocument> documents) const;

    static Result validate_budget(size_t max_volume_bytes, size_t largest_page_bytes,
                                  const SizeEstimator& estimator);

private:
    // Pages sharing an original index; spread halves stay together.
    struct Unit {
        size_t begin = 0;
        size_t end = 0;
        size_t bytes = 0;
    };

    Config config_;
    SizeEstimator estimator_;

    std::vector<Unit> make_units(const std::vector<Page>& pages) const;
    // Fewest parts that fit the budget, boundaries balanced by bytes.
    void split_units(const std::vector<Unit>& units, std::vector<std::pair<size_t, size_t>>& parts) const;
};

}
