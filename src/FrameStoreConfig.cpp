#include "camring/FrameStoreConfig.hpp"
#include "camring/Errors.hpp"

namespace camring {

void FrameStoreConfig::validate() const
{
    if (capacity < 1)
        throw ConfigError("capacity must be at least 1");
    if (capacity > kMaxCapacity)
        throw ConfigError("capacity " + std::to_string(capacity) + " exceeds " +
                          std::to_string(kMaxCapacity) + " slots");
    if (directory.empty())
        throw ConfigError("directory must not be empty");
    if (filename.empty())
        throw ConfigError("filename must not be empty");
    if (roi.width < 0 || roi.height < 0)
        throw ConfigError("default roi has a negative size");
}

std::string FrameStoreConfig::path() const
{
    if (directory.empty()) return filename;
    if (directory.back() == '/') return directory + filename;
    return directory + "/" + filename;
}

} // namespace camring
