#include <sstream>
#include "twr/newick.h"
#include "twr/group_map.h"
#include "twr/tree_stats.h"
#include "twr/util.h"
#include "twr/test_harness.h"
using namespace twr;

char test_read_groups_csv(const TestHarness & h) {
    const auto groups = read_group_map_file(h.get_filepath("groups.csv"));
    if (groups.size() != 4 || count_distinct_groups(groups) != 4) {
        return 'F';
    }
    if (groups.at("sp3") != std::set<std::string>{"GroupB"}) {
        return 'F';
    }
    const std::set<std::string> sp4 = {"GroupC", "GroupD"};
    return (groups.at("sp4") == sp4 ? '.' : 'F');
}

char test_bad_line_reported(const TestHarness & h) {
    try {
        read_group_map_file(h.get_filepath("groups-bad.csv"));
    } catch (const TWRError & x) {
        return (std::string(x.what()).find("line 2") != std::string::npos ? '.' : 'F');
    }
    return 'F';
}

char test_missing_file(const TestHarness & h) {
    try {
        read_group_map_file(h.get_filepath("no-such-groups.csv"));
    } catch (const TWRError &) {
        return '.';
    }
    return 'F';
}

char test_extra_columns_ignored(const TestHarness &) {
    std::istringstream inp("a,g1,extra\nb,\"g,2\"\n");
    const auto groups = read_group_map(inp, "inline.csv");
    if (groups.at("a") != std::set<std::string>{"g1"}) {
        return 'F';
    }
    return (groups.at("b") == std::set<std::string>{"g,2"} ? '.' : 'F');
}

char test_empty_field_rejected(const TestHarness &) {
    std::istringstream inp("a,g1\nb,\n");
    try {
        read_group_map(inp, "inline.csv");
    } catch (const TWRError & x) {
        return (std::string(x.what()).find("line 2") != std::string::npos ? '.' : 'F');
    }
    return 'F';
}

char test_groups_present_in_tree(const TestHarness & h) {
    const auto groups = read_group_map_file(h.get_filepath("groups.csv"));
    auto tree = tree_from_newick_string("((sp1,sp2),(sp4,other));");
    if (count_groups_present(*tree, groups) != 3) {
        return 'F';
    }
    auto narrow = tree_from_newick_string("(sp1,sp2);");
    return (count_groups_present(*narrow, groups) == 1 ? '.' : 'F');
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_read_groups_csv", test_read_groups_csv)
                   , TestFn("test_bad_line_reported", test_bad_line_reported)
                   , TestFn("test_missing_file", test_missing_file)
                   , TestFn("test_extra_columns_ignored", test_extra_columns_ignored)
                   , TestFn("test_empty_field_rejected", test_empty_field_rejected)
                   , TestFn("test_groups_present_in_tree", test_groups_present_in_tree)
                  };
    return th.run_tests(tests);
}
