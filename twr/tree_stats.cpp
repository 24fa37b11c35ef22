#include "twr/tree_stats.h"
#include "twr/tree_operations.h"

namespace twr {

SupportBranchStats extract_support_and_branch_lengths(const RootedTree & tree) {
    SupportBranchStats r;
    for (auto nd : iter_post(tree)) {
        const auto & node = tree[nd];
        if (node.is_internal() && node.has_support() && node.has_branch_length()) {
            r.supports.push_back(node.get_support());
            r.branch_lengths.push_back(node.get_branch_length());
        }
    }
    return r;
}

bool passes_support_filter(const SupportBranchStats & stats, const SupportFilter & filter) {
    if (stats.supports.empty() || stats.branch_lengths.empty()) {
        return false;
    }
    for (auto s : stats.supports) {
        if (s < filter.min_support) {
            return false;
        }
    }
    for (auto b : stats.branch_lengths) {
        if (b < filter.min_branch) {
            return false;
        }
    }
    return true;
}

bool passes_support_filter(const RootedTree & tree, const SupportFilter & filter) {
    return passes_support_filter(extract_support_and_branch_lengths(tree), filter);
}

bool passes_leaf_count_filter(const RootedTree & tree, std::size_t minLeaves) {
    return count_leaves(tree) >= minLeaves;
}

std::size_t count_groups_present(const RootedTree & tree, const GroupMap & groups) {
    std::set<std::string> present;
    for (auto l : iter_leaf(tree)) {
        auto gIt = groups.find(tree[l].get_name());
        if (gIt != groups.end()) {
            present.insert(gIt->second.begin(), gIt->second.end());
        }
    }
    return present.size();
}

bool passes_group_coverage_filter(const RootedTree & tree,
                                  const GroupMap & groups,
                                  std::size_t minGroups) {
    return count_groups_present(tree, groups) >= minGroups;
}

} // namespace twr
