#include <iostream>
#include <cassert>
#include <vector>
#include <string>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/plan/size_estimator.hpp"
#include "../src/plan/volume_planner.hpp"
#include "../src/transform/page_transformer.hpp"
#include "../src/util/log.hpp"

using namespace panelpress;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

constexpr size_t MB = 1024 * 1024;

static Page sized_page(const std::string& source, int index, size_t bytes, int part = 0, bool spread = false) {
    Page p;
    p.source_id = source;
    p.original_index = index;
    p.part = part;
    p.is_spread = spread;
    p.estimated_bytes = bytes;
    return p;
}

static PlanningDocument document(const std::string& id, const std::vector<size_t>& page_bytes) {
    PlanningDocument doc;
    doc.source_id = id;
    doc.name = id;
    for (size_t i = 0; i < page_bytes.size(); ++i) {
        doc.pages.push_back(sized_page(id, static_cast<int>(i), page_bytes[i]));
    }
    return doc;
}

static VolumePlanner planner(bool merge, size_t budget) {
    VolumePlanner::Config cfg;
    cfg.merge = merge;
    cfg.max_volume_bytes = budget;
    return VolumePlanner(cfg, SizeEstimator());
}

TEST(estimator_is_additive) {
    SizeEstimator est;
    std::vector<Page> pages = {sized_page("a", 0, 1000), sized_page("a", 1, 2000)};
    assert(est.volume_bytes(pages) == SizeEstimator::VOLUME_OVERHEAD_BYTES + 3000);

    Page raw;
    raw.data.resize(500);
    assert(est.page_bytes(raw) == 500 + PageTransformer::PAGE_OVERHEAD_BYTES);

    SizeEstimator with_cover(4096);
    assert(with_cover.volume_overhead() == SizeEstimator::VOLUME_OVERHEAD_BYTES + 4096);
}

TEST(merge_small_documents_into_one_volume) {
    std::vector<PlanningDocument> docs = {document("first", {1000}), document("second", {1000})};
    auto plan = planner(true, 200 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 1);
    const OutputVolume& vol = plan.volumes[0];
    assert(vol.index == 1);
    assert(vol.pages.size() == 2);
    assert(vol.pages[0].source_id == "first");
    assert(vol.pages[1].source_id == "second");
    assert(vol.source_ids.size() == 2);
    assert(vol.source_ids[0] == "first" && vol.source_ids[1] == "second");
    assert(vol.estimated_bytes == SizeEstimator::VOLUME_OVERHEAD_BYTES + 2000);
    assert(!vol.oversized);
}

TEST(merge_closes_volume_when_next_document_overflows) {
    std::vector<PlanningDocument> docs = {
        document("a", {80 * MB}), document("b", {80 * MB}), document("c", {80 * MB})
    };
    auto plan = planner(true, 100 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 3);
    for (size_t i = 0; i < 3; ++i) {
        assert(plan.volumes[i].index == static_cast<int>(i) + 1);
        assert(plan.volumes[i].pages.size() == 1);
        assert(plan.volumes[i].estimated_bytes <= 100 * MB);
    }
    assert(plan.volumes[0].source_ids[0] == "a");
    assert(plan.volumes[2].source_ids[0] == "c");
}

TEST(large_document_is_split_per_page) {
    std::vector<PlanningDocument> docs = {document("big", {80 * MB, 80 * MB, 80 * MB})};
    auto plan = planner(true, 100 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 3);
    int expected = 0;
    for (const auto& vol : plan.volumes) {
        assert(vol.estimated_bytes <= 100 * MB);
        for (const auto& p : vol.pages) {
            assert(p.original_index == expected++);
        }
    }
    assert(expected == 3);
}

TEST(two_part_split_lands_near_midpoint) {
    std::vector<PlanningDocument> docs = {document("doc", {30 * MB, 30 * MB, 30 * MB, 30 * MB})};
    auto plan = planner(false, 100 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 2);
    assert(plan.volumes[0].pages.size() == 2);
    assert(plan.volumes[1].pages.size() == 2);
}

TEST(split_uses_fewest_volumes) {
    std::vector<size_t> pages(9, 30 * MB);
    std::vector<PlanningDocument> docs = {document("doc", pages)};
    auto plan = planner(false, 100 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 3);
    for (const auto& vol : plan.volumes) {
        assert(vol.pages.size() == 3);
        assert(vol.estimated_bytes <= 100 * MB);
    }

    // Uneven pages: greedy needs three volumes, and every boundary keeps the budget.
    std::vector<PlanningDocument> uneven = {document("u", {50 * MB, 10 * MB, 10 * MB, 50 * MB, 40 * MB, 20 * MB})};
    plan = planner(false, 100 * MB).plan(std::move(uneven));
    assert(plan.volumes.size() == 3);
    int expected = 0;
    for (const auto& vol : plan.volumes) {
        assert(vol.estimated_bytes <= 100 * MB);
        for (const auto& p : vol.pages) assert(p.original_index == expected++);
    }
    assert(expected == 6);
}

TEST(separate_volumes_without_merge) {
    std::vector<PlanningDocument> docs = {document("a", {1000, 1000}), document("b", {1000})};
    auto plan = planner(false, 200 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 2);
    assert(plan.volumes[0].pages.size() == 2);
    assert(plan.volumes[0].source_ids.size() == 1 && plan.volumes[0].source_ids[0] == "a");
    assert(plan.volumes[1].source_ids.size() == 1 && plan.volumes[1].source_ids[0] == "b");
}

TEST(merge_continues_after_split_document) {
    std::vector<PlanningDocument> docs = {
        document("a", {60 * MB, 60 * MB}), document("b", {10 * MB})
    };
    auto plan = planner(true, 100 * MB).plan(std::move(docs));
    // "a" is split in two; "b" joins the open second part.
    assert(plan.volumes.size() == 2);
    assert(plan.volumes[1].pages.size() == 2);
    assert(plan.volumes[1].source_ids.size() == 2);
    assert(plan.volumes[1].source_ids[1] == "b");
}

TEST(spread_halves_stay_together) {
    PlanningDocument doc;
    doc.source_id = "doc";
    doc.name = "doc";
    doc.pages.push_back(sized_page("doc", 0, 40 * MB));
    doc.pages.push_back(sized_page("doc", 1, 40 * MB, 0, true));
    doc.pages.push_back(sized_page("doc", 1, 40 * MB, 1, true));
    doc.pages.push_back(sized_page("doc", 2, 40 * MB));
    std::vector<PlanningDocument> docs;
    docs.push_back(std::move(doc));

    auto plan = planner(false, 100 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 3);
    assert(plan.volumes[1].pages.size() == 2);
    assert(plan.volumes[1].pages[0].original_index == 1 && plan.volumes[1].pages[0].part == 0);
    assert(plan.volumes[1].pages[1].original_index == 1 && plan.volumes[1].pages[1].part == 1);
}

TEST(oversized_single_page_is_flagged) {
    std::vector<PlanningDocument> docs = {document("huge", {150 * MB})};
    auto plan = planner(false, 100 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 1);
    assert(plan.volumes[0].oversized);
    assert(!plan.warnings.empty());
}

TEST(empty_document_is_skipped) {
    std::vector<PlanningDocument> docs = {document("empty", {}), document("real", {1000})};
    auto plan = planner(false, 200 * MB).plan(std::move(docs));
    assert(plan.volumes.size() == 1);
    assert(plan.volumes[0].index == 1);
    assert(plan.warnings.size() == 1);
}

TEST(every_page_lands_in_exactly_one_volume) {
    std::vector<PlanningDocument> docs = {
        document("a", {7 * MB, 9 * MB, 11 * MB, 5 * MB}),
        document("b", {13 * MB, 2 * MB}),
        document("c", {17 * MB, 17 * MB, 17 * MB})
    };
    auto plan = planner(true, 30 * MB).plan(std::move(docs));
    size_t total = 0;
    std::string last_source;
    int last_index = -1;
    for (const auto& vol : plan.volumes) {
        assert(!vol.empty());
        assert(vol.estimated_bytes <= 30 * MB);
        for (const auto& p : vol.pages) {
            if (p.source_id == last_source) {
                assert(p.original_index > last_index);
            }
            last_source = p.source_id;
            last_index = p.original_index;
            total++;
        }
    }
    assert(total == 9);
}

TEST(budget_validation) {
    SizeEstimator est;
    assert(VolumePlanner::validate_budget(200 * MB, 5 * MB, est).success());
    assert(VolumePlanner::validate_budget(MB, 2 * MB, est).failure());
    assert(VolumePlanner::validate_budget(10, 1, est).failure());
    assert(VolumePlanner::validate_budget(SizeEstimator::VOLUME_OVERHEAD_BYTES + PageTransformer::PAGE_OVERHEAD_BYTES, 1, est).failure());
}

int main() {
    std::cout << "=== PanelPress Planner Test Suite ===\n\n";
    log::set_quiet(true);

    RUN_TEST(estimator_is_additive);
    RUN_TEST(merge_small_documents_into_one_volume);
    RUN_TEST(merge_closes_volume_when_next_document_overflows);
    RUN_TEST(large_document_is_split_per_page);
    RUN_TEST(two_part_split_lands_near_midpoint);
    RUN_TEST(split_uses_fewest_volumes);
    RUN_TEST(separate_volumes_without_merge);
    RUN_TEST(merge_continues_after_split_document);
    RUN_TEST(spread_halves_stay_together);
    RUN_TEST(oversized_single_page_is_flagged);
    RUN_TEST(empty_document_is_skipped);
    RUN_TEST(every_page_lands_in_exactly_one_volume);
    RUN_TEST(budget_validation);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll planner tests passed.\n";
        return 0;
    }

    std::cout << "\nSome planner tests failed.\n";
    return 1;
}
