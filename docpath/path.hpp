// path.hpp - Positional paths into a document tree
//
// A Path is a list of child indexes that locates a node in a tree. The empty
// path is the root; each element is the index of a child at that depth. Paths
// are plain values compared element-wise.

#ifndef DOCPATH_PATH_HPP
#define DOCPATH_PATH_HPP

#include <string>
#include <vector>

namespace docpath {

typedef std::vector<int> Path;
typedef std::vector<Path> PathList;

// ============================================================================
// Value helpers
// ============================================================================

// true if every index is non-negative
bool path_is_valid(const Path& path);

// "[0,1,2]", "[]" for the root
std::string path_to_string(const Path& path);

// ============================================================================
// Relational predicates
// ============================================================================

/**
 * Compare two paths over their shared length, returning -1, 0 or 1.
 *
 * Note: two paths of unequal length compare 0 when one is above the other.
 * Use path_equals() for exact matching.
 */
int path_compare(const Path& path, const Path& another);

bool path_equals(const Path& path, const Path& another);
bool path_is_before(const Path& path, const Path& another);
bool path_is_after(const Path& path, const Path& another);

bool path_is_ancestor(const Path& path, const Path& another);
bool path_is_descendant(const Path& path, const Path& another);
bool path_is_parent(const Path& path, const Path& another);
bool path_is_child(const Path& path, const Path& another);

// ancestor or equal
bool path_is_common(const Path& path, const Path& another);
bool path_is_sibling(const Path& path, const Path& another);

/**
 * Boundary predicates. With i = path.size() - 1, these check that
 * path[0..i) equals another[0..i) and then compare path[i] against
 * another[i]: less for ends_before, greater for ends_after.
 *
 * path_ends_at() is true when another continues path, i.e. another's prefix
 * of path's length equals path.
 */
bool path_ends_before(const Path& path, const Path& another);
bool path_ends_at(const Path& path, const Path& another);
bool path_ends_after(const Path& path, const Path& another);

// ============================================================================
// Derivations
// ============================================================================

// every prefix of path, [] first and path last (reversed on request)
PathList path_levels(const Path& path, bool reverse = false);

// path_levels() without the path itself
PathList path_ancestors(const Path& path, bool reverse = false);

// longest shared prefix
Path path_common(const Path& path, const Path& another);

// The following throw PathError on contract violations.
Path path_next(const Path& path);
Path path_previous(const Path& path);
Path path_parent(const Path& path);
Path path_relative(const Path& path, const Path& ancestor);

} // namespace docpath

#endif // DOCPATH_PATH_HPP
