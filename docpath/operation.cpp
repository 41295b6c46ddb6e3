// operation.cpp - Operation names and factories

#include "operation.hpp"

namespace docpath {

const char* operation_type_name(OperationType type) {
    switch (type) {
        case OperationType::InsertNode:   return "insert_node";
        case OperationType::RemoveNode:   return "remove_node";
        case OperationType::MergeNode:    return "merge_node";
        case OperationType::SplitNode:    return "split_node";
        case OperationType::MoveNode:     return "move_node";
        case OperationType::InsertText:   return "insert_text";
        case OperationType::RemoveText:   return "remove_text";
        case OperationType::SetNode:      return "set_node";
        case OperationType::SetSelection: return "set_selection";
    }
    return "unknown";
}

bool operation_is_structural(const Operation& op) {
    switch (op.type) {
        case OperationType::InsertNode:
        case OperationType::RemoveNode:
        case OperationType::MergeNode:
        case OperationType::SplitNode:
        case OperationType::MoveNode:
            return true;
        case OperationType::InsertText:
        case OperationType::RemoveText:
        case OperationType::SetNode:
        case OperationType::SetSelection:
            return false;
    }
    return false;
}

static Operation make_op(OperationType type, const Path& path) {
    Operation op;
    op.type = type;
    op.path = path;
    return op;
}

Operation op_insert_node(const Path& path) {
    return make_op(OperationType::InsertNode, path);
}

Operation op_remove_node(const Path& path) {
    return make_op(OperationType::RemoveNode, path);
}

Operation op_merge_node(const Path& path, int position) {
    Operation op = make_op(OperationType::MergeNode, path);
    op.position = position;
    return op;
}

Operation op_split_node(const Path& path, int position) {
    Operation op = make_op(OperationType::SplitNode, path);
    op.position = position;
    return op;
}

Operation op_move_node(const Path& path, const Path& new_path) {
    Operation op = make_op(OperationType::MoveNode, path);
    op.new_path = new_path;
    return op;
}

Operation op_insert_text(const Path& path, int offset, const std::string& text) {
    Operation op = make_op(OperationType::InsertText, path);
    op.offset = offset;
    op.text = text;
    return op;
}

Operation op_remove_text(const Path& path, int offset, const std::string& text) {
    Operation op = make_op(OperationType::RemoveText, path);
    op.offset = offset;
    op.text = text;
    return op;
}

Operation op_set_node(const Path& path) {
    return make_op(OperationType::SetNode, path);
}

Operation op_set_selection() {
    return Operation();
}

} // namespace docpath
