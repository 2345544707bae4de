#include "source/page_source.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <algorithm>
#include <filesystem>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include "stb_image.h"

namespace panelpress {

namespace fs = std::filesystem;

namespace {

const char* const IMAGE_EXTENSIONS[] = {
    ".jpg", ".jpeg", ".png", ".bmp", ".webp", ".tif", ".tiff", ".gif"
};

}

bool is_image_file(const std::string& path) {
    for (const char* ext : IMAGE_EXTENSIONS) {
        if (iends_with(path, ext)) return true;
    }
    return false;
}

bool probe_image_size(const uint8_t* data, size_t size, Size& out) {
    if (!data || size == 0 || size > static_cast<size_t>(INT32_MAX)) return false;
    int w = 0, h = 0, comp = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &w, &h, &comp)) {
        return false;
    }
    out = {w, h};
    return true;
}

Result scan_image_directory(const std::string& dir, std::vector<RawPage>& pages) {
    pages.clear();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "not a directory: " + dir);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (!name.empty() && name[0] == '.') continue;
        if (is_image_file(name)) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot list " + dir + ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), [&dir](const fs::path& a, const fs::path& b) {
        return natural_less(fs::relative(a, dir).generic_string(), fs::relative(b, dir).generic_string());
    });

    pages.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        RawPage page;
        page.index = static_cast<int>(i);
        page.name = files[i].filename().string();
        page.path = files[i].string();
        page.byte_size = static_cast<size_t>(fs::file_size(files[i], ec));
        if (ec) {
            page.byte_size = 0;
            ec.clear();
        }
        int w = 0, h = 0, comp = 0;
        if (stbi_info(page.path.c_str(), &w, &h, &comp)) {
            page.size = {w, h};
        } else {
            log::debug("cannot read image header of " + page.path);
        }
        pages.push_back(std::move(page));
    }
    return Result::ok();
}

Result load_page_bytes(const RawPage& page, std::vector<uint8_t>& out) {
    if (page.in_memory()) {
        out = page.bytes;
        return Result::ok();
    }
    if (page.path.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "page " + page.name + " has no data");
    }
    if (!read_file(page.path, out)) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot read " + page.path);
    }
    return Result::ok();
}

std::optional<SourceSummary> SourceProvider::describe(const std::string& session_id,
                                                      const std::string& source_id) const {
    SourceDocument doc;
    if (open(session_id, source_id, doc).failure()) {
        return std::nullopt;
    }
    SourceSummary summary;
    summary.name = doc.name;
    summary.page_count = static_cast<int>(doc.pages.size());
    for (const auto& p : doc.pages) {
        summary.largest_page_bytes = std::max(summary.largest_page_bytes, p.byte_size);
    }
    return summary;
}

DirectorySourceProvider::DirectorySourceProvider(std::string upload_root, ReadingDirection direction)
    : root_(std::move(upload_root)), direction_(direction) {}

std::string DirectorySourceProvider::source_dir(const std::string& session_id,
                                                const std::string& source_id) const {
    if (session_id.empty() || source_id.empty() ||
        session_id.find("..") != std::string::npos || source_id.find("..") != std::string::npos ||
        session_id.find('/') != std::string::npos || source_id.find('/') != std::string::npos) {
        return {};
    }
    std::error_code ec;
    fs::path base = fs::path(root_) / session_id;
    fs::path extracted = base / (source_id + "_images");
    if (fs::is_directory(extracted, ec)) return extracted.string();
    fs::path plain = base / source_id;
    if (fs::is_directory(plain, ec)) return plain.string();
    return {};
}

bool DirectorySourceProvider::contains(const std::string& session_id, const std::string& source_id) const {
    return !source_dir(session_id, source_id).empty();
}

Result DirectorySourceProvider::open(const std::string& session_id, const std::string& source_id,
                                     SourceDocument& out) const {
    std::string dir = source_dir(session_id, source_id);
    if (dir.empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "source not found: " + source_id);
    }
    SourceDocument doc;
    doc.id = source_id;
    doc.name = source_id;
    doc.direction = direction_;
    Result r = scan_image_directory(dir, doc.pages);
    if (r.failure()) return r;
    out = std::move(doc);
    return Result::ok();
}

void MemorySourceProvider::add(const std::string& session_id, SourceDocument doc) {
    for (size_t i = 0; i < doc.pages.size(); ++i) {
        RawPage& p = doc.pages[i];
        p.index = static_cast<int>(i);
        if (p.in_memory()) {
            p.byte_size = p.bytes.size();
            if (p.size.empty()) {
                probe_image_size(p.bytes.data(), p.bytes.size(), p.size);
            }
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = doc.id;
    sessions_[session_id][id] = std::move(doc);
}

Result MemorySourceProvider::add_directory(const std::string& session_id, const std::string& source_id,
                                           const std::string& dir, ReadingDirection direction) {
    SourceDocument doc;
    doc.id = source_id;
    doc.name = fs::path(dir).filename().string();
    if (doc.name.empty()) doc.name = fs::path(dir).parent_path().filename().string();
    doc.direction = direction;
    Result r = scan_image_directory(dir, doc.pages);
    if (r.failure()) return r;
    add(session_id, std::move(doc));
    return Result::ok();
}

void MemorySourceProvider::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

bool MemorySourceProvider::contains(const std::string& session_id, const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && it->second.count(source_id) > 0;
}

Result MemorySourceProvider::open(const std::string& session_id, const std::string& source_id,
                                  SourceDocument& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "unknown session: " + session_id);
    }
    auto doc = it->second.find(source_id);
    if (doc == it->second.end()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "source not found: " + source_id);
    }
    out = doc->second;
    return Result::ok();
}

}
