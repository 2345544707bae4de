#pragma once

#include "package/epub_writer.hpp"
#include <string>
#include <vector>

namespace panelpress {

// Keeps alphanumerics, space, '-', '_' and '.'; trims; empty becomes "volume".
std::string sanitize_filename(const std::string& name);

// Tokens: {series} {title} {chapter} {volume} {index:03d} {index}.
std::string render_name(const std::string& pattern, const BookMetadata& meta, int index);

// One sanitized base name per index; names shared by several volumes get _partNN.
std::vector<std::string> volume_basenames(const std::string& pattern, const BookMetadata& meta,
                                          const std::vector<int>& indices);

// Title with " (Part n/N)" when the job yields more than one volume.
std::string volume_title(const BookMetadata& meta, int part, int parts);

std::string series_index(const BookMetadata& meta, int index);

}
