#include "twr/newick_writer.h"
#include <iomanip>
#include <sstream>
#include "twr/tree_iter.h"
#include "twr/util.h"

namespace twr {

void write_node_as_newick_label(std::ostream & out,
                                const RootedTree & tree,
                                NodeId nd,
                                const NewickWriteOptions & opts) {
    const auto & node = tree[nd];
    if (node.is_tip() || opts.write_internal_names) {
        if (node.has_name()) {
            write_escaped_for_newick(out, node.get_name());
        }
    }
    if (opts.write_support && node.is_internal() && node.has_support()) {
        if (opts.write_internal_names && node.has_name()) {
            out << ' ';
        }
        std::ostringstream s;
        s << node.get_support();
        out << s.str();
    }
    if (opts.write_branch_lengths && node.has_branch_length()) {
        const auto oldFlags = out.flags();
        const auto oldPrecision = out.precision();
        out << ':' << std::fixed << std::setprecision(opts.branch_precision) << node.get_branch_length();
        out.flags(oldFlags);
        out.precision(oldPrecision);
    }
}

static void write_closing_newick(std::ostream & out,
                                 const RootedTree & tree,
                                 NodeId nd,
                                 NodeId r,
                                 const NewickWriteOptions & opts) {
    out << ')';
    auto n = tree[nd].get_parent();
    write_node_as_newick_label(out, tree, n, opts);
    if (n == r) {
        return;
    }
    while (tree[n].get_next_sib() == NO_NODE) {
        out << ')';
        n = tree[n].get_parent();
        assert(n != NO_NODE);
        write_node_as_newick_label(out, tree, n, opts);
        if (n == r) {
            return;
        }
    }
    out << ',';
}

void write_subtree_newick(std::ostream & out,
                          const RootedTree & tree,
                          NodeId nd,
                          const NewickWriteOptions & opts) {
    assert(nd != NO_NODE);
    if (tree[nd].is_tip()) {
        write_node_as_newick_label(out, tree, nd, opts);
        return;
    }
    for (auto n : iter_pre_n(tree, nd)) {
        if (tree[n].is_tip()) {
            write_node_as_newick_label(out, tree, n, opts);
            if (tree[n].get_next_sib() == NO_NODE) {
                write_closing_newick(out, tree, n, nd, opts);
            } else {
                out << ',';
            }
        } else {
            out << '(';
        }
    }
}

void write_newick(std::ostream & out, const RootedTree & tree, const NewickWriteOptions & opts) {
    if (tree.empty()) {
        throw TWRError() << "Cannot write an empty tree as newick";
    }
    write_subtree_newick(out, tree, tree.get_root(), opts);
    out << ';';
}

void write_newick(std::ostream & out, const RootedTree & tree) {
    NewickWriteOptions opts;
    write_newick(out, tree, opts);
}

std::string newick_string(const RootedTree & tree, const NewickWriteOptions & opts) {
    std::ostringstream s;
    write_newick(s, tree, opts);
    return s.str();
}

std::string newick_string(const RootedTree & tree) {
    NewickWriteOptions opts;
    return newick_string(tree, opts);
}

void db_write_newick(const RootedTree & tree) {
    if (!debugging_output_enabled) {
        return;
    }
    write_newick(std::cerr, tree);
    std::cerr << std::endl;
}

} // namespace twr
