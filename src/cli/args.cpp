#include "args.hpp"
#include "core/device_profiles.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace panelpress {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto take = [&](int& i, const char* flag) -> const char* {
        if (i + 1 < argc) return argv[++i];
        args.error = std::string("missing value for ") + flag;
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "--config") == 0) {
            if (const char* v = take(i, arg)) {
                args.config_path = v;
                if (!validate_path(args.config_path)) args.config_path.clear();
            }
        }
        else if (strcmp(arg, "--session") == 0) {
            if (const char* v = take(i, arg)) args.session = v;
        }
        else if (strcmp(arg, "--device") == 0) {
            if (const char* v = take(i, arg)) {
                if (is_known_device(v)) args.device = v;
                else args.error = std::string("unknown device: ") + v;
            }
        }
        else if (strcmp(arg, "--width") == 0) {
            if (const char* v = take(i, arg)) args.width = clamp_int(std::atoi(v), 1, 10000, 0);
        }
        else if (strcmp(arg, "--height") == 0) {
            if (const char* v = take(i, arg)) args.height = clamp_int(std::atoi(v), 1, 10000, 0);
        }
        else if (strcmp(arg, "--upscale") == 0) {
            if (const char* v = take(i, arg)) {
                std::string m = v;
                if (m == "none" || m == "lanczos" || m == "external") args.upscale = m;
                else args.error = "upscale must be none, lanczos or external";
            }
        }
        else if (strcmp(arg, "--no-spreads") == 0) {
            args.no_spreads = true;
        }
        else if (strcmp(arg, "--rotate-spreads") == 0) {
            args.rotate_spreads = true;
        }
        else if (strcmp(arg, "--fill") == 0) {
            args.fill = true;
        }
        else if (strcmp(arg, "--ltr") == 0) {
            args.ltr = true;
        }
        else if (strcmp(arg, "--merge") == 0) {
            args.merge = true;
        }
        else if (strcmp(arg, "--max-size-mb") == 0) {
            if (const char* v = take(i, arg)) args.max_size_mb = clamp_int(std::atoi(v), 1, 4096, 0);
        }
        else if (strcmp(arg, "--format") == 0) {
            if (const char* v = take(i, arg)) {
                std::string f = v;
                if (f == "epub" || f == "mobi" || f == "both") args.format = f;
                else args.error = "format must be epub, mobi or both";
            }
        }
        else if (strcmp(arg, "--title") == 0) {
            if (const char* v = take(i, arg)) args.title = v;
        }
        else if (strcmp(arg, "--author") == 0) {
            if (const char* v = take(i, arg)) args.author = v;
        }
        else if (strcmp(arg, "--series") == 0) {
            if (const char* v = take(i, arg)) args.series = v;
        }
        else if (strcmp(arg, "--description") == 0) {
            if (const char* v = take(i, arg)) args.description = v;
        }
        else if (strcmp(arg, "--cover") == 0) {
            if (const char* v = take(i, arg)) {
                args.cover_path = v;
                if (!validate_path(args.cover_path)) args.cover_path.clear();
            }
        }
        else if (strcmp(arg, "--chapter") == 0) {
            if (const char* v = take(i, arg)) args.chapter = v;
        }
        else if (strcmp(arg, "--volume") == 0) {
            if (const char* v = take(i, arg)) args.volume = clamp_int(std::atoi(v), 1, 9999, 0);
        }
        else if (strcmp(arg, "--naming") == 0) {
            if (const char* v = take(i, arg)) args.naming = v;
        }
        else if (strcmp(arg, "--workers") == 0) {
            if (const char* v = take(i, arg)) args.workers = clamp_int(std::atoi(v), 0, 256, -1);
        }
        else if (strcmp(arg, "--quality") == 0) {
            if (const char* v = take(i, arg)) args.quality = clamp_int(std::atoi(v), 1, 100, 0);
        }
        else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output-dir") == 0) {
            if (const char* v = take(i, arg)) {
                args.output_dir = v;
                if (!validate_path(args.output_dir)) args.output_dir.clear();
            }
        }
        else if (strcmp(arg, "--bundle") == 0) {
            if (const char* v = take(i, arg)) {
                args.bundle_path = v;
                if (!validate_path(args.bundle_path)) args.bundle_path.clear();
            }
        }
        else if (strcmp(arg, "--status-json") == 0) {
            args.status_json = true;
        }
        else if (strcmp(arg, "--list-devices") == 0) {
            args.list_devices = true;
        }
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.error = std::string("unknown option: ") + arg;
        }
        else if (validate_path(arg)) {
            args.sources.push_back(arg);
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <SOURCE_DIR>...\n", prog);
    printf("       %s [OPTIONS] --session <ID> <SOURCE_ID>...\n\n", prog);
    printf("SOURCE_DIR:\n");
    printf("  Directory of page images, one per chapter or volume, in reading order\n");
    printf("SOURCE_ID:\n");
    printf("  Upload under <upload_dir>/<ID>/, either <SOURCE_ID>/ or <SOURCE_ID>_images/\n\n");
    printf("DEVICE:\n");
    printf("      --device <ID>       Target device (default: kindle_paperwhite_5, see --list-devices)\n");
    printf("      --width <N>         Custom target width in pixels\n");
    printf("      --height <N>        Custom target height in pixels\n");
    printf("      --upscale <MODE>    Upscaling: none, lanczos, external\n");
    printf("      --no-spreads        Keep double-page spreads whole\n");
    printf("      --rotate-spreads    Rotate each half of a split spread\n");
    printf("      --fill              Crop pages to fill the screen instead of fitting\n");
    printf("      --ltr               Left-to-right reading order (default: right-to-left)\n\n");
    printf("OUTPUT:\n");
    printf("      --merge             Merge all sources into one book\n");
    printf("      --max-size-mb <N>   Split volumes above this size (default: 200)\n");
    printf("      --format <FMT>      epub, mobi or both (default: epub)\n");
    printf("      --naming <PATTERN>  File name pattern (default: \"{series} - Chapter {index:03d}\")\n");
    printf("  -o, --output-dir <DIR>  Output directory\n");
    printf("      --bundle <ZIP>      Also write every produced file into one zip\n\n");
    printf("METADATA:\n");
    printf("      --title <TEXT>      Book title\n");
    printf("      --author <TEXT>     Author\n");
    printf("      --series <TEXT>     Series name\n");
    printf("      --description <T>   Description\n");
    printf("      --cover <FILE>      Cover image (default: first page)\n");
    printf("      --chapter <TEXT>    Chapter number or range, e.g. 5 or 1-16\n");
    printf("      --volume <N>        Volume number\n\n");
    printf("GENERAL:\n");
    printf("      --workers <N>       Parallel image workers (default: all cores)\n");
    printf("      --quality <N>       JPEG quality 1-100 (default: 85)\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("      --status-json       Print job status as JSON lines to stdout\n");
    printf("      --list-devices      List device profiles and exit\n");
    printf("  -v, --verbose           Verbose logging\n");
    printf("  -h, --help              Show this help\n");
    printf("\nNAMING TOKENS:\n");
    printf("  {series} {title} {chapter} {volume} {index} {index:03d}\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/panelpress/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/panelpress/config.toml\n");
    printf("    Windows: %%APPDATA%%\\panelpress\\config.toml\n");
}

}
