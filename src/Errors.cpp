#include "camring/Errors.hpp"

namespace camring {

const char* to_string(DeviceErrorCode code)
{
    switch (code) {
    case DeviceErrorCode::Timeout:          return "timeout";
    case DeviceErrorCode::Disconnected:     return "disconnected";
    case DeviceErrorCode::InvalidParameter: return "invalid parameter";
    case DeviceErrorCode::NotRunning:       return "not running";
    }
    return "unknown";
}

} // namespace camring
