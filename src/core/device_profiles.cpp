#include "core/device_profiles.hpp"

namespace panelpress {

const std::vector<DeviceProfile>& device_profiles() {
    static const std::vector<DeviceProfile> profiles = {
        {"kindle_basic", "Kindle Basic (6\")", "kindle", 600, 800, 167, false, OutputFormat::Legacy},
        {"kindle_paperwhite_5", "Kindle Paperwhite 5 (6.8\")", "kindle", 1236, 1648, 300, false, OutputFormat::Primary},
        {"kindle_scribe", "Kindle Scribe (10.2\")", "kindle", 1860, 2480, 300, false, OutputFormat::Primary},
        {"kobo_clara_2e", "Kobo Clara 2E (6\")", "kobo", 1072, 1448, 300, false, OutputFormat::Primary},
        {"kobo_libra_2", "Kobo Libra 2 (7\")", "kobo", 1264, 1680, 300, false, OutputFormat::Primary},
        {"kobo_sage", "Kobo Sage (8\")", "kobo", 1440, 1920, 300, false, OutputFormat::Primary},
        {"custom", "Custom", "custom", 1236, 1648, 300, false, OutputFormat::Primary},
    };
    return profiles;
}

const DeviceProfile& find_device(const std::string& id) {
    const auto& profiles = device_profiles();
    for (const auto& p : profiles) {
        if (p.id == id) return p;
    }
    for (const auto& p : profiles) {
        if (p.id == DEFAULT_DEVICE) return p;
    }
    return profiles.front();
}

bool is_known_device(const std::string& id) {
    for (const auto& p : device_profiles()) {
        if (p.id == id) return true;
    }
    return false;
}

Size resolve_target_size(const std::string& id, int custom_width, int custom_height) {
    if (custom_width > 0 && custom_height > 0) {
        return {custom_width, custom_height};
    }
    return find_device(id).size();
}

}
