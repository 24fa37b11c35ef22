#ifndef TREEWRANGLER_MONOPHYLY_H
#define TREEWRANGLER_MONOPHYLY_H
// Clade tests on leaf-name sets.
// Depends on: tree.h tree_operations.h
// Depended on by: wgd_stats.h
#include "twr/twr_base_includes.h"
#include "twr/tree.h"

namespace twr {

// Deepest attached node whose leaf set contains every leaf labelled with a
//  member of `names`. NO_NODE if none of the names label a leaf.
NodeId find_mrca_of_leaf_names(const RootedTree & tree, const NameSet & names);

// true if some node has as its leaves exactly the leaves labelled with a
//  member of `targets` (every copy of a duplicated name included).
// Throws TWRClassifierError if `targets` is empty or none of them are leaves.
// An intersection of 1 name is trivially a clade.
bool is_monophyletic(const RootedTree & tree, const NameSet & targets);

// Non-throwing variant for a set already restricted to the tree's leaves.
//  Sets with fewer than 2 members (including the empty set) are treated as
//  clades.
bool is_monophyletic_in_tree(const RootedTree & tree, const NameSet & presentNames);

} // namespace twr
#endif
