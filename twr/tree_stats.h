#ifndef TREEWRANGLER_TREE_STATS_H
#define TREEWRANGLER_TREE_STATS_H
// Per-tree statistics and accept/reject filters.
// Depends on: tree.h tree_operations.h
// Depended on by: tools/filter-*.cpp
#include <vector>
#include "twr/twr_base_includes.h"
#include "twr/tree.h"

namespace twr {

struct SupportBranchStats {
    std::vector<double> supports;
    std::vector<double> branch_lengths;
};

// Internal nodes carrying both a support value and a branch length, in the
//  order their closing parentheses appear in the newick.
SupportBranchStats extract_support_and_branch_lengths(const RootedTree & tree);

struct SupportFilter {
    double min_support = 0.7;
    double min_branch = 0.01;
};

// Rejects trees without any annotated internal node.
bool passes_support_filter(const SupportBranchStats & stats, const SupportFilter & filter);
bool passes_support_filter(const RootedTree & tree, const SupportFilter & filter);

bool passes_leaf_count_filter(const RootedTree & tree, std::size_t minLeaves);

// number of distinct groups with at least one leaf in the tree. Leaves absent
//  from the map do not count toward any group.
std::size_t count_groups_present(const RootedTree & tree, const GroupMap & groups);
bool passes_group_coverage_filter(const RootedTree & tree,
                                  const GroupMap & groups,
                                  std::size_t minGroups);

} // namespace twr
#endif
