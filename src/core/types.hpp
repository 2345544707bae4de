#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

namespace panelpress {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    INVALID_ARGUMENT,
    PROCESSING_ERROR,
    IO_ERROR,
    EXTERNAL_TOOL_ERROR,
    CANCELLED
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
    bool empty() const { return width <= 0 || height <= 0; }
};

enum class ReadingDirection {
    RightToLeft,
    LeftToRight
};

inline const char* to_string(ReadingDirection d) {
    return d == ReadingDirection::RightToLeft ? "rtl" : "ltr";
}

inline bool parse_reading_direction(const std::string& s, ReadingDirection& out) {
    if (s == "rtl") { out = ReadingDirection::RightToLeft; return true; }
    if (s == "ltr") { out = ReadingDirection::LeftToRight; return true; }
    return false;
}

enum class UpscaleMethod {
    None,
    Lanczos,
    External
};

inline const char* to_string(UpscaleMethod m) {
    switch (m) {
        case UpscaleMethod::Lanczos: return "lanczos";
        case UpscaleMethod::External: return "external";
        default: return "none";
    }
}

inline bool parse_upscale_method(const std::string& s, UpscaleMethod& out) {
    if (s == "none") { out = UpscaleMethod::None; return true; }
    if (s == "lanczos") { out = UpscaleMethod::Lanczos; return true; }
    if (s == "external") { out = UpscaleMethod::External; return true; }
    return false;
}

// Primary is the EPUB package, Legacy the MOBI derived from it.
enum class OutputFormat {
    Primary,
    Legacy,
    Both
};

inline const char* to_string(OutputFormat f) {
    switch (f) {
        case OutputFormat::Legacy: return "mobi";
        case OutputFormat::Both: return "both";
        default: return "epub";
    }
}

inline bool parse_output_format(const std::string& s, OutputFormat& out) {
    if (s == "epub") { out = OutputFormat::Primary; return true; }
    if (s == "mobi") { out = OutputFormat::Legacy; return true; }
    if (s == "both") { out = OutputFormat::Both; return true; }
    return false;
}

inline bool wants_primary(OutputFormat f) { return f != OutputFormat::Legacy; }
inline bool wants_legacy(OutputFormat f) { return f != OutputFormat::Primary; }

struct RawPage {
    int index = 0;
    std::string name;
    std::string path;
    std::vector<uint8_t> bytes;
    size_t byte_size = 0;
    Size size;

    bool in_memory() const { return !bytes.empty(); }
};

struct SourceDocument {
    std::string id;
    std::string name;
    ReadingDirection direction = ReadingDirection::RightToLeft;
    std::vector<RawPage> pages;

    size_t raw_bytes() const {
        size_t total = 0;
        for (const auto& p : pages) total += p.byte_size;
        return total;
    }
};

struct TransformOptions {
    int target_width = 1236;
    int target_height = 1648;
    UpscaleMethod upscale = UpscaleMethod::None;
    bool detect_spreads = true;
    bool rotate_spreads = false;
    bool fill_screen = false;
    ReadingDirection direction = ReadingDirection::RightToLeft;
    int jpeg_quality = 85;
    float spread_ratio = 1.3f;
};

struct Page {
    std::string source_id;
    int original_index = 0;
    int part = 0;
    bool is_spread = false;
    Size size;
    Size source_size;
    size_t raw_byte_size = 0;
    size_t estimated_bytes = 0;
    std::vector<uint8_t> data;
};

struct OutputVolume {
    int index = 0;
    std::vector<Page> pages;
    std::vector<std::string> source_ids;
    size_t estimated_bytes = 0;
    bool oversized = false;

    bool empty() const { return pages.empty(); }
};

}
