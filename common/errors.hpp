#ifndef EDGEARC_COMMON_ERRORS_HPP
#define EDGEARC_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace edgearc {

// Batch-wide rejection of an input table or parameter set.
// Raised before any output is produced.
class InputValidationError : public std::runtime_error {
public:
    explicit InputValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace edgearc

#endif // EDGEARC_COMMON_ERRORS_HPP
