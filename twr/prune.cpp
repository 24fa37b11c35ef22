#include "twr/prune.h"
#include "twr/tree_operations.h"

namespace twr {

bool prune_node(RootedTree & tree, NodeId nd) {
    const auto par = tree.get_parent(nd);
    if (!par) {
        throw TWRUnsupportedOperation("the root of a tree cannot be pruned");
    }
    const auto sibs = tree.get_siblings(nd);
    if (sibs.size() != 1) {
        tree.detach_this_node(nd);
        return false;
    }
    const NodeId sib = sibs.front();
    const NodeId p = *par;
    const auto gp = tree.get_parent(p);
    tree.detach_this_node(nd);
    tree.detach_this_node(sib);
    if (gp) {
        const auto merged = add_branch_lengths(tree[p].get_optional_branch_length(),
                                               tree[sib].get_optional_branch_length());
        tree.replace_this_node(p, sib);
        tree[sib].set_branch_length(merged);
    } else {
        tree.set_root(sib);
        tree[sib].del_branch_length();
    }
    return true;
}

PruneReport prune_named_nodes(RootedTree & tree, const std::vector<std::string> & names) {
    PruneReport report;
    for (const auto & name : names) {
        const auto matches = tree.find_by_name(name);
        if (matches.empty()) {
            LOG(DEBUG) << "\"" << name << "\" not found in " << tree.get_name();
            report.names_not_found.push_back(name);
            continue;
        }
        for (auto nd : matches) {
            if (!tree.is_attached(nd)) {
                // removed along with an earlier match
                continue;
            }
            if (nd == tree.get_root()) {
                LOG(WARNING) << "Not pruning \"" << name << "\" because it is the root of " << tree.get_name();
                report.root_requests.push_back(name);
                continue;
            }
            if (prune_node(tree, nd)) {
                report.num_reconnections += 1;
            }
            report.num_removed += 1;
        }
    }
    return report;
}

} // namespace twr
