#include "twr/newick.h"
#include "twr/tree_iter.h"
#include "twr/tree_operations.h"
#include "twr/util.h"
#include "twr/test_harness.h"
using namespace twr;

static const char * NWK = "((A:1,B:2)x:3,(C:4,D:5)y:6,E:7)r;";

template<typename R>
std::vector<std::string> names_in_order(const RootedTree & tree, const R & range) {
    std::vector<std::string> r;
    for (auto nd : range) {
        r.push_back(tree[nd].get_name());
    }
    return r;
}

char test_preorder(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const std::vector<std::string> expected = {"r", "x", "A", "B", "y", "C", "D", "E"};
    return (test_vec_element_equality(expected, names_in_order(*tree, iter_pre(*tree))) ? '.' : 'F');
}

char test_postorder(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const std::vector<std::string> expected = {"A", "B", "x", "C", "D", "y", "E", "r"};
    return (test_vec_element_equality(expected, names_in_order(*tree, iter_post(*tree))) ? '.' : 'F');
}

char test_leaves_restartable(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const std::vector<std::string> expected = {"A", "B", "C", "D", "E"};
    const auto leaves = iter_leaf(*tree);
    if (!test_vec_element_equality(expected, names_in_order(*tree, leaves))) {
        return 'F';
    }
    // a second pass over the same range starts from the beginning again
    return (test_vec_element_equality(expected, names_in_order(*tree, leaves)) ? '.' : 'F');
}

char test_subtree_iteration(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const auto y = tree->find_by_name("y").at(0);
    const std::vector<std::string> pre = {"y", "C", "D"};
    const std::vector<std::string> post = {"C", "D", "y"};
    if (!test_vec_element_equality(pre, names_in_order(*tree, iter_pre_n(*tree, y)))) {
        return 'F';
    }
    if (!test_vec_element_equality(post, names_in_order(*tree, iter_post_n(*tree, y)))) {
        return 'F';
    }
    const std::vector<std::string> kids = {"x", "y", "E"};
    return (test_vec_element_equality(kids, names_in_order(*tree, iter_child(*tree, tree->get_root()))) ? '.' : 'F');
}

char test_internal_iteration(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const std::vector<std::string> expected = {"r", "x", "y"};
    return (test_vec_element_equality(expected, names_in_order(*tree, iter_internal(*tree))) ? '.' : 'F');
}

char test_find_by_name_duplicates(const TestHarness &) {
    auto tree = tree_from_newick_string("((A,B),(A,C));");
    const auto matches = tree->find_by_name("A");
    if (matches.size() != 2 || matches[0] == matches[1]) {
        return 'F';
    }
    return (tree->find_by_name("Z").empty() ? '.' : 'F');
}

char test_parent_and_siblings(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const auto root = tree->get_root();
    if (tree->get_parent(root)) {
        return 'F';
    }
    const auto a = tree->find_by_name("A").at(0);
    const auto x = tree->find_by_name("x").at(0);
    if (tree->get_parent(a) != std::optional<NodeId>(x)) {
        return 'F';
    }
    const std::vector<std::string> sibs = {"y", "E"};
    std::vector<std::string> obtained;
    for (auto s : tree->get_siblings(x)) {
        obtained.push_back((*tree)[s].get_name());
    }
    if (!test_vec_element_equality(sibs, obtained)) {
        return 'F';
    }
    return (tree->get_siblings(root).empty() ? '.' : 'F');
}

char test_leaf_sets(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const auto y = tree->find_by_name("y").at(0);
    const NameSet expected{"C", "D"};
    if (get_leaf_names_n(*tree, y) != expected) {
        return 'F';
    }
    if (count_leaves(*tree) != 5 || count_leaves_n(*tree, y) != 2) {
        return 'F';
    }
    if (!test_double_equality(28.0, sum_of_branch_lengths(*tree))) {
        return 'F';
    }
    const auto c = tree->find_by_name("C").at(0);
    return (test_double_equality(10.0, path_length(*tree, tree->get_root(), c)) ? '.' : 'F');
}

char test_detached_nodes_not_visited(const TestHarness &) {
    auto tree = tree_from_newick_string(NWK);
    const auto y = tree->find_by_name("y").at(0);
    const auto c = tree->find_by_name("C").at(0);
    tree->detach_this_node(y);
    const std::vector<std::string> expected = {"A", "B", "E"};
    if (!test_vec_element_equality(expected, names_in_order(*tree, iter_leaf(*tree)))) {
        return 'F';
    }
    if (tree->is_attached(c) || tree->is_attached(y)) {
        return 'F';
    }
    if (!tree->find_by_name("C").empty()) {
        return 'F';
    }
    // still in the arena
    return (tree->get_num_allocated_nodes() == 8 && (*tree)[c].get_name() == "C" ? '.' : 'F');
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_preorder", test_preorder)
                   , TestFn("test_postorder", test_postorder)
                   , TestFn("test_leaves_restartable", test_leaves_restartable)
                   , TestFn("test_subtree_iteration", test_subtree_iteration)
                   , TestFn("test_internal_iteration", test_internal_iteration)
                   , TestFn("test_find_by_name_duplicates", test_find_by_name_duplicates)
                   , TestFn("test_parent_and_siblings", test_parent_and_siblings)
                   , TestFn("test_leaf_sets", test_leaf_sets)
                   , TestFn("test_detached_nodes_not_visited", test_detached_nodes_not_visited)
                  };
    return th.run_tests(tests);
}
