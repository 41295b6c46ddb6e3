// path.cpp - Path predicates and derivations

#include "path.hpp"
#include "path_error.hpp"
#include <algorithm>

namespace docpath {

// true if a and b both have at least n elements and agree on the first n
static bool prefix_matches(const Path& a, const Path& b, size_t n) {
    if (a.size() < n || b.size() < n) return false;
    return std::equal(a.begin(), a.begin() + n, b.begin());
}

bool path_is_valid(const Path& path) {
    for (int index : path) {
        if (index < 0) return false;
    }
    return true;
}

std::string path_to_string(const Path& path) {
    std::string out = "[";
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) out += ",";
        out += std::to_string(path[i]);
    }
    out += "]";
    return out;
}

// ============================================================================
// Relational predicates
// ============================================================================

int path_compare(const Path& path, const Path& another) {
    size_t min = std::min(path.size(), another.size());
    for (size_t i = 0; i < min; i++) {
        if (path[i] < another[i]) return -1;
        if (path[i] > another[i]) return 1;
    }
    return 0;
}

bool path_equals(const Path& path, const Path& another) {
    return path == another;
}

bool path_is_before(const Path& path, const Path& another) {
    return path_compare(path, another) == -1;
}

bool path_is_after(const Path& path, const Path& another) {
    return path_compare(path, another) == 1;
}

bool path_is_ancestor(const Path& path, const Path& another) {
    return path.size() < another.size() && path_compare(path, another) == 0;
}

bool path_is_descendant(const Path& path, const Path& another) {
    return path.size() > another.size() && path_compare(path, another) == 0;
}

bool path_is_parent(const Path& path, const Path& another) {
    return path.size() + 1 == another.size() && path_compare(path, another) == 0;
}

bool path_is_child(const Path& path, const Path& another) {
    return path.size() == another.size() + 1 && path_compare(path, another) == 0;
}

bool path_is_common(const Path& path, const Path& another) {
    return path.size() <= another.size() && path_compare(path, another) == 0;
}

bool path_is_sibling(const Path& path, const Path& another) {
    if (path.empty() || path.size() != another.size()) return false;
    size_t last = path.size() - 1;
    return path[last] != another[last] && prefix_matches(path, another, last);
}

bool path_ends_before(const Path& path, const Path& another) {
    if (path.empty()) return false;
    size_t i = path.size() - 1;
    // another must reach depth i for there to be an index to compare with
    if (another.size() <= i) return false;
    return prefix_matches(path, another, i) && path[i] < another[i];
}

bool path_ends_at(const Path& path, const Path& another) {
    return prefix_matches(path, another, path.size());
}

bool path_ends_after(const Path& path, const Path& another) {
    if (path.empty()) return false;
    size_t i = path.size() - 1;
    if (another.size() <= i) return false;
    return prefix_matches(path, another, i) && path[i] > another[i];
}

// ============================================================================
// Derivations
// ============================================================================

PathList path_levels(const Path& path, bool reverse) {
    PathList list;
    list.reserve(path.size() + 1);
    for (size_t i = 0; i <= path.size(); i++) {
        list.emplace_back(path.begin(), path.begin() + i);
    }
    if (reverse) {
        std::reverse(list.begin(), list.end());
    }
    return list;
}

PathList path_ancestors(const Path& path, bool reverse) {
    PathList list = path_levels(path, reverse);
    if (reverse) {
        list.erase(list.begin());
    } else {
        list.pop_back();
    }
    return list;
}

Path path_common(const Path& path, const Path& another) {
    Path common;
    for (size_t i = 0; i < path.size() && i < another.size(); i++) {
        if (path[i] != another[i]) break;
        common.push_back(path[i]);
    }
    return common;
}

Path path_next(const Path& path) {
    if (path.empty()) {
        path_raise(PATH_ERR_ROOT_PATH, "Cannot get the next path of a root path " + path_to_string(path) +
            ", because it has no next index.");
    }
    Path next = path;
    next.back() += 1;
    return next;
}

Path path_previous(const Path& path) {
    if (path.empty()) {
        path_raise(PATH_ERR_ROOT_PATH, "Cannot get the previous path of a root path " + path_to_string(path) +
            ", because it has no previous index.");
    }
    if (path.back() <= 0) {
        path_raise(PATH_ERR_NEGATIVE_INDEX, "Cannot get the previous path of a first child path " +
            path_to_string(path) + " because it would result in a negative index.");
    }
    Path previous = path;
    previous.back() -= 1;
    return previous;
}

Path path_parent(const Path& path) {
    if (path.empty()) {
        path_raise(PATH_ERR_ROOT_PATH, "Cannot get the parent path of the root path " + path_to_string(path) + ".");
    }
    return Path(path.begin(), path.end() - 1);
}

Path path_relative(const Path& path, const Path& ancestor) {
    if (!path_is_ancestor(ancestor, path) && !path_equals(path, ancestor)) {
        path_raise(PATH_ERR_NOT_ANCESTOR, "Cannot get the relative path of " + path_to_string(path) +
            " inside ancestor " + path_to_string(ancestor) + ", because it is not above or equal to the path.");
    }
    return Path(path.begin() + ancestor.size(), path.end());
}

} // namespace docpath
