#ifndef TREEWRANGLER_PRUNE_H
#define TREEWRANGLER_PRUNE_H
// Removal of named nodes with reconnection of the surviving sibling.
// Depends on: tree.h tree_operations.h
// Depended on by: tools/prune-nodes.cpp
#include <string>
#include <vector>
#include "twr/twr_base_includes.h"
#include "twr/tree.h"

namespace twr {

struct PruneReport {
    std::size_t num_removed = 0;          // nodes detached
    std::size_t num_reconnections = 0;    // sole siblings moved to the grandparent (or root)
    std::vector<std::string> names_not_found;
    std::vector<std::string> root_requests; // names that matched the root; left in place
};

// Removes `nd` (and the subtree below it).
// If nd has exactly one sibling, that sibling replaces their parent, with a
//  branch length equal to the sum of the two lengths. If the parent was the
//  root, the sibling becomes the new root without a branch length.
// Returns true if a reconnection was made.
// Throws TWRUnsupportedOperation if nd is the root.
bool prune_node(RootedTree & tree, NodeId nd);

// prunes every attached node carrying one of `names`; names are handled in
//  the order given.
PruneReport prune_named_nodes(RootedTree & tree, const std::vector<std::string> & names);

} // namespace twr
#endif
