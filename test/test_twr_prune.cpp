#include "twr/newick.h"
#include "twr/newick_writer.h"
#include "twr/prune.h"
#include "twr/tree_operations.h"
#include "twr/util.h"
#include "twr/test_harness.h"
using namespace twr;

static NewickWriteOptions precision(int p) {
    NewickWriteOptions opts;
    opts.branch_precision = p;
    return opts;
}

static bool check_newick(const RootedTree & tree, const std::string & expected, int p) {
    const auto obtained = newick_string(tree, precision(p));
    if (obtained != expected) {
        test_complete_diff_message(expected, obtained);
        return false;
    }
    return true;
}

char test_sole_sibling_takes_parent_place(const TestHarness &) {
    auto tree = tree_from_newick_string("((A:0.1,B:0.2)n1:0.3,(C:0.4,D:0.5)n2:0.6)root;");
    const auto report = prune_named_nodes(*tree, {"B"});
    if (report.num_removed != 1 || report.num_reconnections != 1) {
        return 'F';
    }
    return (check_newick(*tree, "(A:0.4,(C:0.4,D:0.5)n2:0.6)root;", 1) ? '.' : 'F');
}

char test_missing_name_leaves_tree(const TestHarness &) {
    const std::string nwk = "((A:0.1,B:0.2)n1:0.3,(C:0.4,D:0.5)n2:0.6)root;";
    auto tree = tree_from_newick_string(nwk);
    const auto before = sum_of_branch_lengths(*tree);
    const auto report = prune_named_nodes(*tree, {"Z"});
    if (report.num_removed != 0) {
        return 'F';
    }
    const std::vector<std::string> missing = {"Z"};
    if (!test_vec_element_equality(missing, report.names_not_found)) {
        return 'F';
    }
    if (!test_double_equality(before, sum_of_branch_lengths(*tree))) {
        return 'F';
    }
    return (check_newick(*tree, nwk, 1) ? '.' : 'F');
}

char test_polytomy_keeps_parent(const TestHarness &) {
    auto tree = tree_from_newick_string("(A:1,B:2,C:3)r;");
    const auto report = prune_named_nodes(*tree, {"A"});
    if (report.num_reconnections != 0) {
        return 'F';
    }
    return (check_newick(*tree, "(B:2,C:3)r;", 0) ? '.' : 'F');
}

char test_sibling_of_root_child_becomes_root(const TestHarness &) {
    auto tree = tree_from_newick_string("(A:1,B:2);");
    prune_named_nodes(*tree, {"A"});
    return (check_newick(*tree, "B;", 0) ? '.' : 'F');
}

char test_internal_node_removed_with_subtree(const TestHarness &) {
    auto tree = tree_from_newick_string("((A,B)x,(C,D)y)r;");
    const auto a = tree->find_by_name("A").at(0);
    prune_named_nodes(*tree, {"x"});
    if (tree->is_attached(a)) {
        return 'F';
    }
    return (check_newick(*tree, "(C,D)y;", 0) ? '.' : 'F');
}

char test_root_request_reported(const TestHarness &) {
    const std::string nwk = "((A,B)x,(C,D)y)r;";
    auto tree = tree_from_newick_string(nwk);
    const auto report = prune_named_nodes(*tree, {"r"});
    const std::vector<std::string> rootReq = {"r"};
    if (!test_vec_element_equality(rootReq, report.root_requests)) {
        return 'F';
    }
    if (report.num_removed != 0 || !check_newick(*tree, nwk, 0)) {
        return 'F';
    }
    try {
        prune_node(*tree, tree->get_root());
    } catch (const TWRUnsupportedOperation &) {
        return '.';
    }
    return 'F';
}

char test_names_applied_in_order(const TestHarness &) {
    auto tree = tree_from_newick_string("((A:1,B:2)x:3,C:4)r;");
    const auto report = prune_named_nodes(*tree, {"A", "B"});
    if (report.num_removed != 2 || report.num_reconnections != 2) {
        return 'F';
    }
    return (check_newick(*tree, "C;", 0) ? '.' : 'F');
}

char test_every_duplicate_removed(const TestHarness &) {
    auto tree = tree_from_newick_string("((A:1,B:1):1,(A:1,C:1):1);");
    const auto report = prune_named_nodes(*tree, {"A"});
    if (report.num_removed != 2) {
        return 'F';
    }
    return (check_newick(*tree, "(B:2,C:2);", 0) ? '.' : 'F');
}

char test_path_length_conserved(const TestHarness &) {
    auto tree = tree_from_newick_string("((A:0.1,(C:0.2,D:0.3)s:0.4)p:0.5,E:1)g;");
    const auto c = tree->find_by_name("C").at(0);
    const auto d = tree->find_by_name("D").at(0);
    const auto beforeC = path_length(*tree, tree->get_root(), c);
    const auto beforeD = path_length(*tree, tree->get_root(), d);
    prune_named_nodes(*tree, {"A"});
    if (!test_double_equality(beforeC, path_length(*tree, tree->get_root(), c))) {
        return 'F';
    }
    if (!test_double_equality(1.1, path_length(*tree, tree->get_root(), c))) {
        return 'F';
    }
    return (test_double_equality(beforeD, path_length(*tree, tree->get_root(), d)) ? '.' : 'F');
}

char test_missing_lengths_stay_missing(const TestHarness &) {
    auto tree = tree_from_newick_string("(((A,B)x,C)y,D)r;");
    prune_named_nodes(*tree, {"C"});
    const auto x = tree->find_by_name("x").at(0);
    if ((*tree)[x].has_branch_length()) {
        return 'F';
    }
    return (check_newick(*tree, "((A,B)x,D)r;", 0) ? '.' : 'F');
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_sole_sibling_takes_parent_place", test_sole_sibling_takes_parent_place)
                   , TestFn("test_missing_name_leaves_tree", test_missing_name_leaves_tree)
                   , TestFn("test_polytomy_keeps_parent", test_polytomy_keeps_parent)
                   , TestFn("test_sibling_of_root_child_becomes_root", test_sibling_of_root_child_becomes_root)
                   , TestFn("test_internal_node_removed_with_subtree", test_internal_node_removed_with_subtree)
                   , TestFn("test_root_request_reported", test_root_request_reported)
                   , TestFn("test_names_applied_in_order", test_names_applied_in_order)
                   , TestFn("test_every_duplicate_removed", test_every_duplicate_removed)
                   , TestFn("test_path_length_conserved", test_path_length_conserved)
                   , TestFn("test_missing_lengths_stay_missing", test_missing_lengths_stay_missing)
                  };
    return th.run_tests(tests);
}
