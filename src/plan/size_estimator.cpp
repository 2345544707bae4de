#include "plan/size_estimator.hpp"
#include "transform/page_transformer.hpp"

namespace panelpress {

size_t SizeEstimator::page_bytes(const Page& page) const {
    if (page.estimated_bytes > 0) return page.estimated_bytes;
    return page.data.size() + PageTransformer::PAGE_OVERHEAD_BYTES;
}

size_t SizeEstimator::volume_bytes(const std::vector<Page>& pages) const {
    size_t total = volume_overhead();
    for (const auto& p : pages) total += page_bytes(p);
    return total;
}

}
