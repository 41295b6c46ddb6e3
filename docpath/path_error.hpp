/**
 * @file path_error.hpp
 * @brief Coded errors for path contract violations
 *
 * Taking the next/previous/parent of the root path, the previous of a first
 * child, or the relative path against a non-ancestor are caller errors. They
 * are raised as PathError, which carries one of the codes below.
 */

#ifndef DOCPATH_PATH_ERROR_HPP
#define DOCPATH_PATH_ERROR_HPP

#include <stdexcept>
#include <string>

namespace docpath {

// ============================================================================
// Error Codes
// ============================================================================

enum PathErrorCode {
    PATH_ERR_OK = 0,
    PATH_ERR_ROOT_PATH = 100,        // root path has no last index / parent
    PATH_ERR_NEGATIVE_INDEX = 101,   // result would hold a negative index
    PATH_ERR_NOT_ANCESTOR = 102,     // argument is not above or equal to the path
};

const char* path_err_code_name(PathErrorCode code);
const char* path_err_code_message(PathErrorCode code);

// ============================================================================
// PathError
// ============================================================================

class PathError : public std::invalid_argument {
public:
    PathError(PathErrorCode code, const std::string& message)
        : std::invalid_argument(message), code_(code) {}

    PathErrorCode code() const { return code_; }

private:
    PathErrorCode code_;
};

/**
 * Log the message at error level and throw a PathError.
 */
[[noreturn]] void path_raise(PathErrorCode code, const std::string& message);

} // namespace docpath

#endif // DOCPATH_PATH_ERROR_HPP
