#pragma once

#include <string>
#include <vector>

namespace panelpress {

struct Args {
    std::vector<std::string> sources;
    // When set, sources are ids of uploads under storage.upload_dir/<session>.
    std::string session;
    std::string config_path;

    std::string device;
    int width = 0;
    int height = 0;
    std::string upscale;
    bool no_spreads = false;
    bool rotate_spreads = false;
    bool fill = false;
    bool ltr = false;

    bool merge = false;
    int max_size_mb = 0;
    std::string format;

    std::string title;
    std::string author;
    std::string series;
    std::string description;
    std::string cover_path;
    std::string chapter;
    int volume = 0;
    std::string naming;

    int workers = -1;
    int quality = 0;
    std::string output_dir;
    std::string bundle_path;

    bool status_json = false;
    bool list_devices = false;
    bool verbose = false;
    bool show_help = false;

    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
