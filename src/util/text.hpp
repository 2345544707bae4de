#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace panelpress {

std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool iends_with(const std::string& s, const std::string& suffix);

// Numeric runs compare by value, so "page2" sorts before "page10".
bool natural_less(const std::string& a, const std::string& b);

// Random RFC 4122 version 4 identifier.
std::string make_uuid();
// 32 lowercase hex digits.
std::string make_id();

std::string iso8601_utc(int64_t unix_ms);
int64_t now_unix_ms();

bool read_file(const std::string& path, std::vector<uint8_t>& out);
bool write_file(const std::string& path, const std::vector<uint8_t>& data);

}
