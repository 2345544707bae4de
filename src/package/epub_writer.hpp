#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace panelpress {

struct BookMetadata {
    std::string title;
    std::string author;
    std::string series;
    std::string description;
    std::string language = "en";
    std::string chapter;
    int volume = 0;
    // Encoded JPEG, already fitted to the device; empty means first page.
    std::vector<uint8_t> cover;
    Size cover_size;
};

// Per-volume values derived from the job metadata.
struct VolumeLabel {
    std::string title;
    std::string series_index = "1";
};

class EpubWriter {
public:
    struct Config {
        int width = 1236;
        int height = 1648;
        ReadingDirection direction = ReadingDirection::RightToLeft;
    };

    explicit EpubWriter(const Config& config);

    Result write(const std::string& path, const OutputVolume& volume, const BookMetadata& meta,
                 const VolumeLabel& label) const;

    static std::string page_name(int number);
    static std::string image_name(int number);

    std::string container_xml() const;
    std::string stylesheet() const;
    std::string page_xhtml(const std::string& label, const std::string& image, Size image_size) const;
    std::string package_opf(const OutputVolume& volume, const BookMetadata& meta,
                            const VolumeLabel& label, const std::string& uid) const;
    std::string toc_ncx(const OutputVolume& volume, const std::string& title, const std::string& uid) const;
    std::string nav_xhtml(const OutputVolume& volume, const std::string& title) const;

private:
    Config config_;
};

}
