#pragma once

#include "core/types.hpp"
#include <vector>

namespace panelpress {

// Package size model: encoded page bytes plus a fixed per-page overhead, plus a
// fixed per-volume overhead for the container, stylesheet, navigation and
// metadata. Stored JPEG entries keep the model within about 1 KB per page of
// the written archive.
class SizeEstimator {
public:
    static constexpr size_t VOLUME_OVERHEAD_BYTES = 50000;

    explicit SizeEstimator(size_t extra_volume_bytes = 0) : extra_volume_bytes_(extra_volume_bytes) {}

    size_t page_bytes(const Page& page) const;
    size_t volume_overhead() const { return VOLUME_OVERHEAD_BYTES + extra_volume_bytes_; }
    size_t volume_bytes(const std::vector<Page>& pages) const;

private:
    size_t extra_volume_bytes_;
};

}
