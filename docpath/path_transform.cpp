// path_transform.cpp - Path rebasing for structural edits

#include "path_transform.hpp"
#include "../lib/log.h"

namespace docpath {

static log_category_t* transform_log() {
    return log_get_category("docpath.transform");
}

// add delta to the index at depth; depth -1 (an operation addressed at the
// root) names no element and leaves the path as is
static void shift(Path& p, long depth, int delta) {
    if (depth < 0 || depth >= (long)p.size()) return;
    p[depth] += delta;
}

static long last_depth(const Path& path) {
    return (long)path.size() - 1;
}

static OptionalPath invalidated(const Path& path, const Operation& op) {
    clog_debug(transform_log(), "%s at %s invalidated %s", operation_type_name(op.type),
        path_to_string(op.path).c_str(), path_to_string(path).c_str());
    return optional_path_none();
}

// ============================================================================
// Per-operation rebasing, each working on its own copy p
// ============================================================================

static OptionalPath transform_insert_node(Path p, const Operation& op) {
    const Path& at = op.path;
    if (path_equals(at, p) || path_ends_before(at, p) || path_is_ancestor(at, p)) {
        shift(p, last_depth(at), 1);
    }
    return optional_path_some(p);
}

static OptionalPath transform_remove_node(Path p, const Operation& op) {
    const Path& at = op.path;
    if (path_equals(at, p) || path_is_ancestor(at, p)) {
        return invalidated(p, op);
    }
    if (path_ends_before(at, p)) {
        shift(p, last_depth(at), -1);
    }
    return optional_path_some(p);
}

static OptionalPath transform_merge_node(Path p, const Operation& op) {
    const Path& at = op.path;
    if (path_equals(at, p) || path_ends_before(at, p)) {
        shift(p, last_depth(at), -1);
    } else if (path_is_ancestor(at, p)) {
        // Children of the merged node are appended after the ones the
        // previous sibling already had. Whether this offset holds for every
        // nested merge is unverified; the tests pin the current result.
        shift(p, last_depth(at), -1);
        shift(p, (long)at.size(), op.position);
    }
    return optional_path_some(p);
}

static OptionalPath transform_split_node(Path p, const Operation& op, Affinity affinity) {
    const Path& at = op.path;
    if (path_equals(at, p)) {
        switch (affinity) {
            case AFFINITY_FORWARD:
                shift(p, last_depth(p), 1);
                break;
            case AFFINITY_BACKWARD:
                // still names the left-hand node
                break;
            case AFFINITY_NONE:
                clog_debug(transform_log(), "split_node at %s: no affinity for %s",
                    path_to_string(at).c_str(), path_to_string(p).c_str());
                return optional_path_none();
        }
    } else if (path_ends_before(at, p)) {
        shift(p, last_depth(at), 1);
    } else if (path_is_ancestor(at, p) && p[at.size()] >= op.position) {
        // moved into the right-hand node, whose children start again at 0
        shift(p, last_depth(at), 1);
        shift(p, (long)at.size(), -op.position);
    }
    return optional_path_some(p);
}

/*
 * Move rebasing keeps the established algebra as is, gaps included:
 *  - a path that ends before the destination without being under the moved
 *    node is not treated by the first branch;
 *  - the second branch does not consider the source being an ancestor of the
 *    destination;
 *  - the last branch only runs when the destination neither ends before, at,
 *    nor above p, so its equality check never succeeds.
 */
static OptionalPath transform_move_node(Path p, const Operation& op) {
    const Path& from = op.path;
    const Path& to = op.new_path;

    if (path_equals(from, to)) {
        clog_debug(transform_log(), "move_node %s onto itself", path_to_string(from).c_str());
        return optional_path_some(p);
    }

    if (path_is_ancestor(from, p) || path_equals(from, p)) {
        Path moved = to;
        if (path_ends_before(from, to) && from.size() < to.size()) {
            // the source was removed ahead of the destination at its own depth
            shift(moved, last_depth(from), -1);
        }
        moved.insert(moved.end(), p.begin() + from.size(), p.end());
        return optional_path_some(moved);
    }

    if (path_ends_before(to, p) || path_equals(to, p) || path_is_ancestor(to, p)) {
        if (path_ends_before(from, p)) {
            shift(p, last_depth(from), -1);
        }
        shift(p, last_depth(to), 1);
    } else if (path_ends_before(from, p)) {
        if (path_equals(to, p)) {
            shift(p, last_depth(to), 1);
        }
        shift(p, last_depth(from), -1);
    }
    return optional_path_some(p);
}

// ============================================================================
// Public API
// ============================================================================

OptionalPath path_transform(const Path& path, const Operation& op, const TransformOptions& options) {
    // the root is never affected
    if (path.empty()) {
        return optional_path_some(path);
    }

    switch (op.type) {
        case OperationType::InsertNode:
            return transform_insert_node(path, op);
        case OperationType::RemoveNode:
            return transform_remove_node(path, op);
        case OperationType::MergeNode:
            return transform_merge_node(path, op);
        case OperationType::SplitNode:
            return transform_split_node(path, op, options.affinity);
        case OperationType::MoveNode:
            return transform_move_node(path, op);
        case OperationType::InsertText:
        case OperationType::RemoveText:
        case OperationType::SetNode:
        case OperationType::SetSelection:
            break;
    }
    return optional_path_some(path);
}

OptionalPath path_transform_ops(const Path& path, const std::vector<Operation>& ops,
                                const TransformOptions& options) {
    OptionalPath result = optional_path_some(path);
    for (size_t i = 0; i < ops.size(); i++) {
        result = path_transform(result.path, ops[i], options);
        if (!result.has_value) {
            clog_debug(transform_log(), "replay of %s stopped at operation %zu of %zu",
                path_to_string(path).c_str(), i + 1, ops.size());
            break;
        }
    }
    return result;
}

std::vector<OptionalPath> path_transform_list(const PathList& paths, const Operation& op,
                                              const TransformOptions& options) {
    std::vector<OptionalPath> results;
    results.reserve(paths.size());
    for (const Path& path : paths) {
        results.push_back(path_transform(path, op, options));
    }
    return results;
}

} // namespace docpath
