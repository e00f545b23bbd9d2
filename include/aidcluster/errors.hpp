#ifndef AIDCLUSTER_ERRORS_HPP
#define AIDCLUSTER_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace aidcluster {

// Invalid parameter. Fatal to the call; parameter() names the offender.
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(const std::string& parameter, const std::string& detail)
        : std::invalid_argument("invalid " + parameter + ": " + detail),
          parameter_(parameter) {}

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

// Empty matrix, ragged rows, duplicate ids or non-finite values.
class DataShapeError : public std::invalid_argument {
public:
    explicit DataShapeError(const std::string& detail)
        : std::invalid_argument("data shape: " + detail) {}
};

// Non-fatal: a centroid fit hit max_iter before labels stabilised.
// Attached to the returned assignment, never thrown.
struct ConvergenceWarning {
    int iterations = 0;
    size_t max_iter = 0;
    std::string message;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_ERRORS_HPP
