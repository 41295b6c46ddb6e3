// operation.hpp - Tree edit operations as seen by the path core
//
// An Operation is produced by the editing layer for every edit it applies to
// the document tree. Only the fields the path core reads are carried here;
// node payloads and properties stay with the tree model.

#ifndef DOCPATH_OPERATION_HPP
#define DOCPATH_OPERATION_HPP

#include "path.hpp"
#include <string>

namespace docpath {

// ============================================================================
// Operation Types
// ============================================================================

enum class OperationType {
    // Structural: these move, add or remove nodes
    InsertNode,    // node inserted at path
    RemoveNode,    // node at path deleted
    MergeNode,     // node at path merged into its previous sibling
    SplitNode,     // node at path split in two at child offset position
    MoveNode,      // node at path relocated to new_path

    // Non-structural: paths pass through unchanged
    InsertText,    // text inserted at offset in the text node at path
    RemoveText,    // text removed at offset in the text node at path
    SetNode,       // properties of the node at path changed
    SetSelection,  // selection changed, no tree edit
};

// "insert_node", "remove_node", ...
const char* operation_type_name(OperationType type);

struct Operation {
    OperationType type;
    Path path;          // every kind except SetSelection
    Path new_path;      // MoveNode destination
    int position;       // MergeNode/SplitNode child offset
    int offset;         // InsertText/RemoveText character offset
    std::string text;   // InsertText/RemoveText content

    Operation() : type(OperationType::SetSelection), position(0), offset(0) {}
};

bool operation_is_structural(const Operation& op);

// ============================================================================
// Factories
// ============================================================================

Operation op_insert_node(const Path& path);
Operation op_remove_node(const Path& path);
Operation op_merge_node(const Path& path, int position);
Operation op_split_node(const Path& path, int position);
Operation op_move_node(const Path& path, const Path& new_path);
Operation op_insert_text(const Path& path, int offset, const std::string& text);
Operation op_remove_text(const Path& path, int offset, const std::string& text);
Operation op_set_node(const Path& path);
Operation op_set_selection();

} // namespace docpath

#endif // DOCPATH_OPERATION_HPP
