#pragma once

#include <stdexcept>
#include <string>

namespace scaletuner {

// Bad construction parameters: buffer shape/fill, malformed scale, estimator settings.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Object used out of sequence (e.g. reading a Clock that is not running).
class StateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Unknown scale degree or note name.
class LookupError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

} // namespace scaletuner
