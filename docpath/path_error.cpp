/**
 * @file path_error.cpp
 * @brief Error code lookup and raising for path contract violations
 */

#include "path_error.hpp"
#include "../lib/log.h"

namespace docpath {

// ============================================================================
// Error Code Name Lookup
// ============================================================================

typedef struct {
    PathErrorCode code;
    const char* name;
    const char* message;
} PathErrorCodeInfo;

static const PathErrorCodeInfo error_code_table[] = {
    {PATH_ERR_OK, "OK", "Success"},
    {PATH_ERR_ROOT_PATH, "ROOT_PATH", "Operation requires a non-root path"},
    {PATH_ERR_NEGATIVE_INDEX, "NEGATIVE_INDEX", "Result would contain a negative index"},
    {PATH_ERR_NOT_ANCESTOR, "NOT_ANCESTOR", "Path is not above or equal to the other path"},
};

static const PathErrorCodeInfo* find_code_info(PathErrorCode code) {
    for (const PathErrorCodeInfo& info : error_code_table) {
        if (info.code == code) return &info;
    }
    return nullptr;
}

const char* path_err_code_name(PathErrorCode code) {
    const PathErrorCodeInfo* info = find_code_info(code);
    return info ? info->name : "UNKNOWN";
}

const char* path_err_code_message(PathErrorCode code) {
    const PathErrorCodeInfo* info = find_code_info(code);
    return info ? info->message : "Unknown error";
}

void path_raise(PathErrorCode code, const std::string& message) {
    log_error("E%d %s: %s", (int)code, path_err_code_name(code), message.c_str());
    throw PathError(code, message);
}

} // namespace docpath
