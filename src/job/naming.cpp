#include "job/naming.hpp"
#include "util/text.hpp"

#include <cctype>
#include <cstdio>
#include <map>

namespace panelpress {

namespace {

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}

std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '-' || c == '_' || c == '.') {
            out += c;
        }
    }
    out = trim(out);
    while (!out.empty() && out.front() == '.') out.erase(out.begin());
    out = trim(out);
    if (out.empty()) return "volume";
    return out;
}

std::string render_name(const std::string& pattern, const BookMetadata& meta, int index) {
    std::string out = pattern;
    char padded[16];
    std::snprintf(padded, sizeof(padded), "%03d", index);
    const std::string series = meta.series.empty() ? meta.title : meta.series;
    const std::string volume = meta.volume > 0 ? "Vol. " + std::to_string(meta.volume) : "";

    replace_all(out, "{index:03d}", padded);
    replace_all(out, "{index}", std::to_string(index));
    replace_all(out, "{series}", series);
    replace_all(out, "{title}", meta.title);
    replace_all(out, "{chapter}", meta.chapter);
    replace_all(out, "{volume}", volume);
    return sanitize_filename(out);
}

std::vector<std::string> volume_basenames(const std::string& pattern, const BookMetadata& meta,
                                          const std::vector<int>& indices) {
    std::vector<std::string> names;
    names.reserve(indices.size());
    std::map<std::string, int> counts;
    for (int index : indices) {
        names.push_back(render_name(pattern, meta, index));
        ++counts[names.back()];
    }
    std::map<std::string, int> seen;
    for (auto& name : names) {
        if (counts[name] < 2) continue;
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "_part%02d", ++seen[name]);
        name += suffix;
    }
    return names;
}

std::string volume_title(const BookMetadata& meta, int part, int parts) {
    std::string title = meta.title.empty() ? (meta.series.empty() ? "Untitled" : meta.series) : meta.title;
    if (parts > 1) {
        title += " (Part " + std::to_string(part) + "/" + std::to_string(parts) + ")";
    }
    return title;
}

std::string series_index(const BookMetadata& meta, int index) {
    if (meta.volume > 0) return std::to_string(meta.volume);
    size_t i = 0;
    while (i < meta.chapter.size() && std::isspace(static_cast<unsigned char>(meta.chapter[i]))) ++i;
    size_t start = i;
    while (i < meta.chapter.size() &&
           (std::isdigit(static_cast<unsigned char>(meta.chapter[i])) || meta.chapter[i] == '.')) {
        ++i;
    }
    if (i > start) return meta.chapter.substr(start, i - start);
    return std::to_string(index);
}

}
