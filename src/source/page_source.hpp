#pragma once

#include "core/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace panelpress {

struct SourceSummary {
    std::string name;
    int page_count = 0;
    size_t largest_page_bytes = 0;
};

class SourceProvider {
public:
    virtual ~SourceProvider() = default;
    virtual bool contains(const std::string& session_id, const std::string& source_id) const = 0;
    virtual Result open(const std::string& session_id, const std::string& source_id,
                        SourceDocument& out) const = 0;

    // Page count and largest page for submission checks; opens the document by default.
    virtual std::optional<SourceSummary> describe(const std::string& session_id,
                                                  const std::string& source_id) const;
};

// <upload_root>/<session>/<source>/ or <upload_root>/<session>/<source>_images/.
class DirectorySourceProvider : public SourceProvider {
public:
    DirectorySourceProvider(std::string upload_root, ReadingDirection direction);

    bool contains(const std::string& session_id, const std::string& source_id) const override;
    Result open(const std::string& session_id, const std::string& source_id,
                SourceDocument& out) const override;

    std::string source_dir(const std::string& session_id, const std::string& source_id) const;

private:
    std::string root_;
    ReadingDirection direction_;
};

class MemorySourceProvider : public SourceProvider {
public:
    void add(const std::string& session_id, SourceDocument doc);
    Result add_directory(const std::string& session_id, const std::string& source_id,
                         const std::string& dir, ReadingDirection direction);
    void remove_session(const std::string& session_id);

    bool contains(const std::string& session_id, const std::string& source_id) const override;
    Result open(const std::string& session_id, const std::string& source_id,
                SourceDocument& out) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, SourceDocument>> sessions_;
};

bool is_image_file(const std::string& path);

// Pages ordered by natural filename order, dimensions probed from headers.
Result scan_image_directory(const std::string& dir, std::vector<RawPage>& pages);

bool probe_image_size(const uint8_t* data, size_t size, Size& out);

// Loads the bytes of a page that is backed by a file.
Result load_page_bytes(const RawPage& page, std::vector<uint8_t>& out);

}
