#ifndef TREEWRANGLER_TREE_OPERATIONS_H
#define TREEWRANGLER_TREE_OPERATIONS_H
// Functions that operate on trees - may include iteration
//  over trees (contrast w/tree.h)
// Depends on: tree.h tree_iter.h
// Depended on by: monophyly.h prune.h tree_stats.h tools
#include <vector>
#include "twr/twr_base_includes.h"
#include "twr/tree_iter.h"
#include "twr/util.h"

namespace twr {

std::size_t count_leaves(const RootedTree & tree);
std::size_t count_leaves_n(const RootedTree & tree, NodeId nd);
NameSet get_leaf_names(const RootedTree & tree);
NameSet get_leaf_names_n(const RootedTree & tree, NodeId nd);
double sum_of_branch_lengths(const RootedTree & tree);
double path_length(const RootedTree & tree, NodeId anc, NodeId des);
std::optional<double> add_branch_lengths(const std::optional<double> & first, const std::optional<double> & second);

//// impl
inline std::size_t count_leaves_n(const RootedTree & tree, NodeId nd) {
    std::size_t c = 0;
    for (auto l : iter_leaf_n(tree, nd)) {
        (void)l;
        c += 1;
    }
    return c;
}

inline std::size_t count_leaves(const RootedTree & tree) {
    return count_leaves_n(tree, tree.get_root());
}

// computed on demand; trees are restructured by pruning so nothing is cached.
inline NameSet get_leaf_names_n(const RootedTree & tree, NodeId nd) {
    NameSet names;
    for (auto l : iter_leaf_n(tree, nd)) {
        names.insert(tree[l].get_name());
    }
    return names;
}

inline NameSet get_leaf_names(const RootedTree & tree) {
    return get_leaf_names_n(tree, tree.get_root());
}

inline double sum_of_branch_lengths(const RootedTree & tree) {
    double s = 0.0;
    for (auto nd : iter_pre(tree)) {
        if (tree[nd].has_branch_length()) {
            s += tree[nd].get_branch_length();
        }
    }
    return s;
}

// sum of the branch lengths on the path from `des` up to (not including) `anc`
inline double path_length(const RootedTree & tree, NodeId anc, NodeId des) {
    double s = 0.0;
    auto nd = des;
    while (nd != anc) {
        if (nd == NO_NODE) {
            throw TWRError() << "node " << anc << " is not an ancestor of node " << des;
        }
        if (tree[nd].has_branch_length()) {
            s += tree[nd].get_branch_length();
        }
        nd = tree[nd].get_parent();
    }
    return s;
}

inline std::optional<double> add_branch_lengths(const std::optional<double> & first,
                                                const std::optional<double> & second) {
    if (not first and not second) {
        return std::nullopt;
    }
    return first.value_or(0.0) + second.value_or(0.0);
}

} // namespace twr
#endif
