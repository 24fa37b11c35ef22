#include "twr/monophyly.h"
#include <set>
#include <sstream>
#include <vector>
#include "twr/tree_operations.h"

namespace twr {

// every attached leaf whose name is in `names`, in preorder
static std::vector<NodeId> leaves_labelled_with(const RootedTree & tree, const NameSet & names) {
    std::vector<NodeId> r;
    for (auto l : iter_leaf(tree)) {
        if (contains(names, tree[l].get_name())) {
            r.push_back(l);
        }
    }
    return r;
}

NodeId find_mrca_of_leaf_names(const RootedTree & tree, const NameSet & names) {
    if (tree.empty() || names.empty()) {
        return NO_NODE;
    }
    const auto targets = leaves_labelled_with(tree, names);
    if (targets.empty()) {
        return NO_NODE;
    }
    const std::set<NodeId> targetSet(targets.begin(), targets.end());
    // walk rootward until every labelled leaf (duplicates included) is below.
    for (auto nd = targets.front(); nd != NO_NODE; nd = tree[nd].get_parent()) {
        std::size_t numBelow = 0;
        for (auto l : iter_leaf_n(tree, nd)) {
            if (contains(targetSet, l)) {
                numBelow += 1;
            }
        }
        if (numBelow == targetSet.size()) {
            return nd;
        }
    }
    TWR_UNREACHABLE;
}

bool is_monophyletic_in_tree(const RootedTree & tree, const NameSet & presentNames) {
    if (presentNames.size() < 2) {
        return true;
    }
    const auto mrca = find_mrca_of_leaf_names(tree, presentNames);
    if (mrca == NO_NODE) {
        return true;
    }
    for (auto l : iter_leaf_n(tree, mrca)) {
        if (!contains(presentNames, tree[l].get_name())) {
            return false;
        }
    }
    return true;
}

bool is_monophyletic(const RootedTree & tree, const NameSet & targets) {
    if (targets.empty()) {
        throw TWRClassifierError("monophyly test requested for an empty set of names");
    }
    const auto present = set_intersection_as_set(targets, get_leaf_names(tree));
    if (present.empty()) {
        std::ostringstream names;
        write_separated_collection(names, targets, ", ");
        TWRClassifierError x;
        x << "none of the names (" << names.str() << ") label a leaf of "
          << (tree.get_name().empty() ? std::string("the tree") : tree.get_name());
        throw x;
    }
    return is_monophyletic_in_tree(tree, present);
}

} // namespace twr
