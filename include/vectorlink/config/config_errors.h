#pragma once

#include <stdexcept>
#include <string>

namespace vectorlink::config {

// Common base for every failure raised by the robot configuration store.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The file exists but its content cannot be turned into entries:
// malformed lines, an unparsable address, or a certificate that cannot be read.
// The underlying cause, when there is one, is attached with std::throw_with_nested.
class ConfigurationLoadError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

// An entry handed to a write is missing required fields or holds a value the
// file cannot represent. Nothing was written.
class ConfigurationValidationError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

// A filesystem operation (mkdir, open, write, rename) failed, or the store
// path is not absolute.
class ConfigurationIoError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

} // namespace vectorlink::config
