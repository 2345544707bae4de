#pragma once

#include "core/types.hpp"
#include "package/epub_writer.hpp"
#include "package/format_converter.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace panelpress {

struct VolumeArtifacts {
    Result result;
    std::vector<std::string> files;
    std::vector<std::string> warnings;
};

class PackageAssembler {
public:
    struct Config {
        std::string output_dir;
        OutputFormat format = OutputFormat::Primary;
        EpubWriter::Config epub;
    };

    PackageAssembler(const Config& config, std::shared_ptr<FormatConverter> converter);

    // Writes <basename>.epub and, when requested, <basename>.mobi into the
    // output directory. A failed mobi step keeps the epub and adds a warning.
    VolumeArtifacts assemble(const OutputVolume& volume, const BookMetadata& meta, const VolumeLabel& label,
                             const std::string& basename, const std::atomic<bool>& cancel) const;

private:
    Config config_;
    EpubWriter writer_;
    std::shared_ptr<FormatConverter> converter_;
};

}
