#pragma once

#include "core/types.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace panelpress {

class FormatConverter {
public:
    virtual ~FormatConverter() = default;
    virtual Result convert(const std::string& primary_path, const std::string& legacy_path,
                           const std::atomic<bool>& cancel) const = 0;
    virtual const char* name() const = 0;
};

// Used when legacy conversion is turned off; every request fails.
class DisabledConverter : public FormatConverter {
public:
    Result convert(const std::string& primary_path, const std::string& legacy_path,
                   const std::atomic<bool>& cancel) const override;
    const char* name() const override { return "disabled"; }
};

class ExternalCommandConverter : public FormatConverter {
public:
    explicit ExternalCommandConverter(std::string command);

    Result convert(const std::string& primary_path, const std::string& legacy_path,
                   const std::atomic<bool>& cancel) const override;
    const char* name() const override { return "ebook-convert"; }

private:
    std::string command_;
};

std::shared_ptr<FormatConverter> create_converter(bool enabled, const std::string& command);

}
