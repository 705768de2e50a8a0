#pragma once
#include <stdexcept>
#include <string>

namespace camring {

/// Base class for everything the library throws on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid FrameStoreConfig (capacity out of range, empty filename).
class ConfigError : public Error {
public:
    using Error::Error;
};

/// Backing file unwritable, HDF5 create/flush failure, unreadable slot.
class StorageError : public Error {
public:
    using Error::Error;
};

/// Read of a slot index that has no occupant.
class NotFoundError : public Error {
public:
    using Error::Error;
};

/// Slot index outside [0, capacity).
class RangeError : public Error {
public:
    using Error::Error;
};

/// Any operation on a FrameStore after close().
class ClosedError : public Error {
public:
    using Error::Error;
};

/// Export archive could not be written or read.
class IoError : public Error {
public:
    using Error::Error;
};

class UnsupportedFormatError : public IoError {
public:
    using IoError::IoError;
};

enum class DeviceErrorCode {
    Timeout,
    Disconnected,
    InvalidParameter,
    NotRunning,
};

const char* to_string(DeviceErrorCode code);

/**
 * @brief Failure reported by a frame source.
 *
 * The store never catches these; they belong to whoever drives acquisition.
 */
class DeviceError : public Error {
public:
    DeviceError(DeviceErrorCode code, const std::string& msg)
        : Error(std::string(to_string(code)) + ": " + msg), code_(code) {}

    DeviceErrorCode code() const { return code_; }

private:
    DeviceErrorCode code_;
};

} // namespace camring
