#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace panelpress {

struct DeviceProfile {
    std::string id;
    std::string name;
    std::string family;
    int width = 0;
    int height = 0;
    int dpi = 300;
    bool color = false;
    OutputFormat recommended = OutputFormat::Primary;

    Size size() const { return {width, height}; }
};

constexpr const char* DEFAULT_DEVICE = "kindle_paperwhite_5";
constexpr const char* CUSTOM_DEVICE = "custom";

const std::vector<DeviceProfile>& device_profiles();

// Unknown ids resolve to the default device.
const DeviceProfile& find_device(const std::string& id);
bool is_known_device(const std::string& id);

// Custom dimensions win when both are positive, for the custom profile or any other.
Size resolve_target_size(const std::string& id, int custom_width, int custom_height);

}
