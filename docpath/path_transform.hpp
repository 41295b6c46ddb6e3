// path_transform.hpp - Rebasing stored paths across tree edits
//
// After an edit is applied to the document tree, every path held elsewhere
// (cursors, selection endpoints, marks) is passed through path_transform()
// with the same Operation so it keeps naming the same node. A path whose node
// was deleted comes back empty.

#ifndef DOCPATH_PATH_TRANSFORM_HPP
#define DOCPATH_PATH_TRANSFORM_HPP

#include "path.hpp"
#include "operation.hpp"
#include <vector>

namespace docpath {

/**
 * Tie-break for a path that lands exactly on a split point.
 */
enum Affinity {
    AFFINITY_FORWARD,   // follow the new right-hand node
    AFFINITY_BACKWARD,  // stay on the original left-hand node
    AFFINITY_NONE       // refuse to choose; the path is invalidated
};

struct TransformOptions {
    Affinity affinity = AFFINITY_FORWARD;
};

// ============================================================================
// Optional path (empty when the node no longer exists)
// ============================================================================

struct OptionalPath {
    Path path;
    bool has_value;
};

inline OptionalPath optional_path_none() {
    return {Path(), false};
}

inline OptionalPath optional_path_some(const Path& path) {
    return {path, true};
}

// ============================================================================
// Transform
// ============================================================================

/**
 * Rebase path against one operation. The input is never modified; the result
 * is a fresh path, or none if the node (or one of its ancestors) was removed.
 * The root path is returned unchanged for every operation, and non-structural
 * operations leave every path unchanged.
 */
OptionalPath path_transform(const Path& path, const Operation& op,
                            const TransformOptions& options = TransformOptions());

/**
 * Rebase path through an ordered edit log. Each result feeds the next
 * operation; the first invalidation ends the replay with none.
 */
OptionalPath path_transform_ops(const Path& path, const std::vector<Operation>& ops,
                                const TransformOptions& options = TransformOptions());

/**
 * Rebase a batch of paths against one operation, one result per input.
 */
std::vector<OptionalPath> path_transform_list(const PathList& paths, const Operation& op,
                                              const TransformOptions& options = TransformOptions());

} // namespace docpath

#endif // DOCPATH_PATH_TRANSFORM_HPP
