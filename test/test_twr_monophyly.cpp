#include "twr/newick.h"
#include "twr/monophyly.h"
#include "twr/util.h"
#include "twr/test_harness.h"
using namespace twr;

char test_clade_and_non_clade(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2),(3,4));");
    if (!is_monophyletic(*tree, NameSet{"1", "2"})) {
        return 'F';
    }
    if (!is_monophyletic(*tree, NameSet{"3", "4"})) {
        return 'F';
    }
    if (is_monophyletic(*tree, NameSet{"1", "3"})) {
        return 'F';
    }
    return (is_monophyletic(*tree, NameSet{"1", "2", "3", "4"}) ? '.' : 'F');
}

char test_polytomy_is_not_a_clade_for_subset(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2,3),4);");
    if (is_monophyletic(*tree, NameSet{"1", "2"})) {
        return 'F';
    }
    return (is_monophyletic(*tree, NameSet{"1", "2", "3"}) ? '.' : 'F');
}

char test_single_present_name(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2),(3,4));");
    if (!is_monophyletic(*tree, NameSet{"1"})) {
        return 'F';
    }
    // absent names are ignored
    return (is_monophyletic(*tree, NameSet{"1", "X"}) ? '.' : 'F');
}

char test_absent_names_restricted(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2),(3,4));");
    return (is_monophyletic(*tree, NameSet{"1", "2", "X", "Y"}) ? '.' : 'F');
}

char test_empty_targets_throw(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2),(3,4));");
    try {
        is_monophyletic(*tree, NameSet{});
    } catch (const TWRClassifierError &) {
        return '.';
    }
    return 'F';
}

char test_no_present_targets_throw(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2),(3,4));");
    try {
        is_monophyletic(*tree, NameSet{"X", "Y"});
    } catch (const TWRClassifierError & x) {
        const std::string msg = x.what();
        return (msg.find("X, Y") != std::string::npos ? '.' : 'F');
    }
    return 'F';
}

char test_small_sets_in_tree(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,2),(3,4));");
    if (!is_monophyletic_in_tree(*tree, NameSet{})) {
        return 'F';
    }
    return (is_monophyletic_in_tree(*tree, NameSet{"3"}) ? '.' : 'F');
}

char test_mrca(const TestHarness &) {
    auto tree = tree_from_newick_string("(((1,2)a,3)b,4)r;");
    const auto b = tree->find_by_name("b").at(0);
    const auto a = tree->find_by_name("a").at(0);
    if (find_mrca_of_leaf_names(*tree, NameSet{"1", "3"}) != b) {
        return 'F';
    }
    if (find_mrca_of_leaf_names(*tree, NameSet{"2", "1", "Z"}) != a) {
        return 'F';
    }
    if (find_mrca_of_leaf_names(*tree, NameSet{"Z"}) != NO_NODE) {
        return 'F';
    }
    return (find_mrca_of_leaf_names(*tree, NameSet{"1", "4"}) == tree->get_root() ? '.' : 'F');
}

char test_clade_at_root_child(const TestHarness &) {
    auto tree = tree_from_newick_string("((1,(2,3)),4);");
    if (!is_monophyletic(*tree, NameSet{"2", "3"})) {
        return 'F';
    }
    if (is_monophyletic(*tree, NameSet{"1", "2"})) {
        return 'F';
    }
    return (is_monophyletic(*tree, NameSet{"1", "2", "3"}) ? '.' : 'F');
}

char test_duplicate_names(const TestHarness &) {
    auto tree = tree_from_newick_string("((A,B),(A,C));");
    if (is_monophyletic(*tree, NameSet{"A", "B"})) {
        return 'F';
    }
    if (find_mrca_of_leaf_names(*tree, NameSet{"A", "B"}) != tree->get_root()) {
        return 'F';
    }
    auto paired = tree_from_newick_string("((A,B),((A,B),C));");
    if (is_monophyletic(*paired, NameSet{"A", "B"})) {
        return 'F';
    }
    auto together = tree_from_newick_string("(((A,B),A),C);");
    return (is_monophyletic(*together, NameSet{"A", "B"}) ? '.' : 'F');
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_clade_and_non_clade", test_clade_and_non_clade)
                   , TestFn("test_polytomy_is_not_a_clade_for_subset", test_polytomy_is_not_a_clade_for_subset)
                   , TestFn("test_single_present_name", test_single_present_name)
                   , TestFn("test_absent_names_restricted", test_absent_names_restricted)
                   , TestFn("test_empty_targets_throw", test_empty_targets_throw)
                   , TestFn("test_no_present_targets_throw", test_no_present_targets_throw)
                   , TestFn("test_small_sets_in_tree", test_small_sets_in_tree)
                   , TestFn("test_mrca", test_mrca)
                   , TestFn("test_clade_at_root_child", test_clade_at_root_child)
                   , TestFn("test_duplicate_names", test_duplicate_names)
                  };
    return th.run_tests(tests);
}
