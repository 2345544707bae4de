#include "package/zip_writer.hpp"
#include <zip.h>

namespace panelpress {

ZipWriter::ZipWriter() = default;

ZipWriter::~ZipWriter() {
    discard();
}

std::string ZipWriter::last_error() const {
    if (!archive_) return "archive not open";
    return zip_strerror(archive_);
}

Result ZipWriter::open(const std::string& path) {
    discard();
    int err = 0;
    archive_ = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!archive_) {
        zip_error_t error;
        zip_error_init_with_code(&error, err);
        std::string msg = zip_error_strerror(&error);
        zip_error_fini(&error);
        return Result::fail(ErrorCode::IO_ERROR, "cannot create " + path + ": " + msg);
    }
    path_ = path;
    return Result::ok();
}

Result ZipWriter::add_source(const std::string& name, void* source, bool compress) {
    zip_source_t* src = static_cast<zip_source_t*>(source);
    zip_int64_t idx = zip_file_add(archive_, name.c_str(), src, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
    if (idx < 0) {
        zip_source_free(src);
        return Result::fail(ErrorCode::IO_ERROR, "cannot add " + name + ": " + last_error());
    }
    zip_int32_t method = compress ? ZIP_CM_DEFLATE : ZIP_CM_STORE;
    if (zip_set_file_compression(archive_, static_cast<zip_uint64_t>(idx), method, 0) != 0) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot set compression for " + name + ": " + last_error());
    }
    return Result::ok();
}

Result ZipWriter::add_text(const std::string& name, std::string content, bool compress) {
    if (!archive_) return Result::fail(ErrorCode::IO_ERROR, "archive not open");
    owned_.push_back(std::move(content));
    const std::string& data = owned_.back();
    zip_source_t* src = zip_source_buffer(archive_, data.data(), data.size(), 0);
    if (!src) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot buffer " + name + ": " + last_error());
    }
    return add_source(name, src, compress);
}

Result ZipWriter::add_buffer(const std::string& name, const std::vector<uint8_t>& data, bool compress) {
    if (!archive_) return Result::fail(ErrorCode::IO_ERROR, "archive not open");
    zip_source_t* src = zip_source_buffer(archive_, data.data(), data.size(), 0);
    if (!src) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot buffer " + name + ": " + last_error());
    }
    return add_source(name, src, compress);
}

Result ZipWriter::add_file(const std::string& name, const std::string& path, bool compress) {
    if (!archive_) return Result::fail(ErrorCode::IO_ERROR, "archive not open");
    zip_source_t* src = zip_source_file(archive_, path.c_str(), 0, -1);
    if (!src) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot read " + path + ": " + last_error());
    }
    return add_source(name, src, compress);
}

Result ZipWriter::commit() {
    if (!archive_) return Result::fail(ErrorCode::IO_ERROR, "archive not open");
    if (zip_close(archive_) != 0) {
        std::string msg = last_error();
        zip_discard(archive_);
        archive_ = nullptr;
        owned_.clear();
        return Result::fail(ErrorCode::IO_ERROR, "cannot write " + path_ + ": " + msg);
    }
    archive_ = nullptr;
    owned_.clear();
    return Result::ok();
}

void ZipWriter::discard() {
    if (archive_) {
        zip_discard(archive_);
        archive_ = nullptr;
    }
    owned_.clear();
}

}
