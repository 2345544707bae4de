#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace panelpress {

// Stores every file of `dir` named in `files` into one ZIP at `zip_path`.
Result write_bundle(const std::string& zip_path, const std::string& dir, const std::vector<std::string>& files);

}
