#ifndef TREEWRANGLER_NEWICK_WRITER_H
#define TREEWRANGLER_NEWICK_WRITER_H
// Serialization of RootedTree as newick.
// Depends on: tree.h tree_iter.h util.h
// Depended on by: tools tests
#include <iostream>
#include <string>
#include "twr/twr_base_includes.h"
#include "twr/tree.h"

namespace twr {

struct NewickWriteOptions {
    int branch_precision = 10;        // digits after the decimal point
    bool write_support = false;       // emit "name support" on internal nodes
    bool write_internal_names = true;
    bool write_branch_lengths = true;
};

void write_node_as_newick_label(std::ostream & out,
                                const RootedTree & tree,
                                NodeId nd,
                                const NewickWriteOptions & opts);
// writes the subtree rooted at nd (no trailing ;)
void write_subtree_newick(std::ostream & out,
                          const RootedTree & tree,
                          NodeId nd,
                          const NewickWriteOptions & opts);
// writes the whole tree followed by ;
void write_newick(std::ostream & out, const RootedTree & tree, const NewickWriteOptions & opts);
void write_newick(std::ostream & out, const RootedTree & tree);
std::string newick_string(const RootedTree & tree, const NewickWriteOptions & opts);
std::string newick_string(const RootedTree & tree);

void db_write_newick(const RootedTree & tree);

} // namespace twr
#endif
