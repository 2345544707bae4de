#include "plan/volume_planner.hpp"
#include "transform/page_transformer.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <limits>

namespace panelpress {

VolumePlanner::VolumePlanner(const Config& config, const SizeEstimator& estimator)
    : config_(config), estimator_(estimator) {}

Result VolumePlanner::validate_budget(size_t max_volume_bytes, size_t largest_page_bytes,
                                      const SizeEstimator& estimator) {
    size_t floor = estimator.volume_overhead() + PageTransformer::PAGE_OVERHEAD_BYTES;
    if (max_volume_bytes <= floor) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "max volume size of " + std::to_string(max_volume_bytes) +
                            " bytes cannot hold a single page");
    }
    if (largest_page_bytes > max_volume_bytes) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "max volume size of " + std::to_string(max_volume_bytes) +
                            " bytes is smaller than the largest page (" +
                            std::to_string(largest_page_bytes) + " bytes)");
    }
    return Result::ok();
}

std::vector<VolumePlanner::Unit> VolumePlanner::make_units(const std::vector<Page>& pages) const {
    std::vector<Unit> units;
    for (size_t i = 0; i < pages.size(); ++i) {
        bool same = !units.empty() && pages[i].is_spread &&
                    pages[units.back().begin].is_spread &&
                    pages[units.back().begin].original_index == pages[i].original_index;
        if (same) {
            units.back().end = i + 1;
            units.back().bytes += estimator_.page_bytes(pages[i]);
        } else {
            units.push_back({i, i + 1, estimator_.page_bytes(pages[i])});
        }
    }
    return units;
}

void VolumePlanner::split_units(const std::vector<Unit>& units,
                               std::vector<std::pair<size_t, size_t>>& parts) const {
    const size_t n = units.size();
    std::vector<size_t> prefix(n + 1, 0);
    for (size_t k = 0; k < n; ++k) prefix[k + 1] = prefix[k] + units[k].bytes;

    const size_t overhead = estimator_.volume_overhead();
    auto fits = [&](size_t begin, size_t end) {
        return end - begin <= 1 || overhead + prefix[end] - prefix[begin] <= config_.max_volume_bytes;
    };

    // reach[i]: furthest end of a volume starting at unit i.
    // needed[i]: fewest volumes that hold units [i, n), filled greedily.
    std::vector<size_t> reach(n, 0);
    std::vector<size_t> needed(n + 1, 0);
    size_t end = 0;
    for (size_t i = 0; i < n; ++i) {
        end = std::max(end, i + 1);
        while (end < n && fits(i, end + 1)) ++end;
        reach[i] = end;
    }
    for (size_t i = n; i-- > 0;) needed[i] = 1 + needed[reach[i]];

    // Same volume count as greedy filling, with each boundary placed nearest
    // an even share of the remaining bytes.
    size_t begin = 0;
    while (needed[begin] > 1) {
        const size_t remaining = needed[begin];
        const size_t share = (prefix[n] - prefix[begin]) / remaining;
        size_t best = reach[begin];
        size_t best_dist = std::numeric_limits<size_t>::max();
        for (size_t e = begin + 1; e <= reach[begin]; ++e) {
            if (needed[e] > remaining - 1) continue;
            size_t bytes = prefix[e] - prefix[begin];
            size_t dist = bytes > share ? bytes - share : share - bytes;
            if (dist < best_dist) {
                best_dist = dist;
                best = e;
            }
        }
        parts.emplace_back(begin, best);
        begin = best;
    }
    parts.emplace_back(begin, n);
}

VolumePlanner::Plan VolumePlanner::plan(std::vector<PlanningDocument> documents) const {
    Plan result;
    const size_t budget = config_.max_volume_bytes;

    OutputVolume current;
    size_t current_bytes = estimator_.volume_overhead();

    auto close_current = [&]() {
        if (!current.pages.empty()) {
            current.estimated_bytes = current_bytes;
            current.oversized = current_bytes > budget;
            result.volumes.push_back(std::move(current));
        }
        current = OutputVolume{};
        current_bytes = estimator_.volume_overhead();
    };

    auto append = [&](PlanningDocument& doc, size_t begin, size_t end) {
        if (begin >= end) return;
        if (current.source_ids.empty() || current.source_ids.back() != doc.source_id) {
            current.source_ids.push_back(doc.source_id);
        }
        for (size_t i = begin; i < end; ++i) {
            current_bytes += estimator_.page_bytes(doc.pages[i]);
            current.pages.push_back(std::move(doc.pages[i]));
        }
    };

    for (auto& doc : documents) {
        if (doc.pages.empty()) {
            result.warnings.push_back("document " + doc.name + " has no pages and was skipped");
            continue;
        }

        std::vector<Unit> units = make_units(doc.pages);
        size_t doc_bytes = 0;
        for (const auto& u : units) doc_bytes += u.bytes;

        if (!config_.merge) {
            close_current();
        } else if (!current.pages.empty() && current_bytes + doc_bytes > budget) {
            close_current();
        }

        if (current_bytes + doc_bytes <= budget) {
            append(doc, 0, doc.pages.size());
            continue;
        }

        std::vector<std::pair<size_t, size_t>> parts;
        split_units(units, parts);
        for (size_t p = 0; p < parts.size(); ++p) {
            append(doc, units[parts[p].first].begin, units[parts[p].second - 1].end);
            if (p + 1 < parts.size()) {
                close_current();
            }
        }
    }
    close_current();

    for (size_t i = 0; i < result.volumes.size(); ++i) {
        OutputVolume& vol = result.volumes[i];
        vol.index = static_cast<int>(i) + 1;
        if (vol.oversized) {
            std::string msg = "volume " + std::to_string(vol.index) + " holds a single page of " +
                              std::to_string(vol.estimated_bytes) + " bytes, over the " +
                              std::to_string(budget) + " byte limit";
            log::warning(msg);
            result.warnings.push_back(msg);
        }
    }
    return result;
}

}
