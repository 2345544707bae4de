#include "package/bundle.hpp"
#include "package/zip_writer.hpp"

#include <filesystem>

namespace panelpress {

namespace fs = std::filesystem;

Result write_bundle(const std::string& zip_path, const std::string& dir, const std::vector<std::string>& files) {
    if (files.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "no files to bundle");
    }
    ZipWriter zip;
    Result r = zip.open(zip_path);
    if (r.failure()) return r;

    for (const auto& name : files) {
        fs::path path = fs::path(dir) / name;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            zip.discard();
            return Result::fail(ErrorCode::FILE_NOT_FOUND, "missing artifact " + name);
        }
        r = zip.add_file(name, path.string(), false);
        if (r.failure()) {
            zip.discard();
            return r;
        }
    }
    return zip.commit();
}

}
