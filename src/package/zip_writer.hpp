#pragma once

#include "core/types.hpp"
#include <deque>
#include <string>
#include <vector>

struct zip;

namespace panelpress {

// Writes a ZIP archive in entry order. The archive is discarded unless commit()
// succeeds. Buffers passed to add_buffer must stay alive until commit().
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    Result open(const std::string& path);
    Result add_text(const std::string& name, std::string content, bool compress = true);
    Result add_buffer(const std::string& name, const std::vector<uint8_t>& data, bool compress = false);
    Result add_file(const std::string& name, const std::string& path, bool compress = false);
    Result commit();
    void discard();

    bool is_open() const { return archive_ != nullptr; }

private:
    struct zip* archive_ = nullptr;
    std::string path_;
    std::deque<std::string> owned_;

    Result add_source(const std::string& name, void* source, bool compress);
    std::string last_error() const;
};

}
