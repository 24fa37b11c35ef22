#include <iostream>
#include <fstream>
#include <exception>
#include <vector>
#include <cstdlib>

#include "twr/error.h"
#include "twr/tree.h"
#include "twr/twcli.h"
#include "twr/group_map.h"
#include "twr/tree_stats.h"

using namespace twr;

using std::string;
using std::vector;
using std::cerr;

namespace po = boost::program_options;
using po::variables_map;

variables_map parse_cmd_line(int argc,char* argv[]) {
    using namespace po;

    options_description invisible("Invisible options");
    invisible.add_options()
        ("input", value<vector<string>>()->composing(),"Filenames for newick trees")
        ;

    options_description filter("Filter options");
    filter.add_options()
        ("groups-csv,g", value<string>(), "CSV file (no header) mapping leaf names to groups: id,group")
        ("min-groups,m", value<unsigned>()->default_value(30), "Minimum number of groups with a leaf in the tree")
        ("no-support-labels", "Treat numeric internal labels as names rather than support values")
        ;

    options_description output("Output options");
    output.add_options()
        ("out,o", value<string>(), "Output newick file (default: standard output)")
        ;

    options_description visible;
    visible.add(filter).add(output).add(twr::standard_options());

    positional_options_description p;
    p.add("input", -1);

    variables_map vm = twr::parse_cmd_line_standard(argc, argv,
                                                    "Usage: twr-filter-groups <newick-file1> <newick-file2> ... --groups-csv FILE [--min-groups N] [OPTIONS]\n"
                                                    "Keep the trees that include leaves from at least N different groups.",
                                                    visible, invisible, p);
    return vm;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc,argv);
        if (not args.count("groups-csv")) {
            throw TWRError() << "Group mapping not specified!  Use --groups-csv=<file>";
        }
        const auto groups = read_group_map_file(args["groups-csv"].as<string>());
        const std::size_t minGroups = args["min-groups"].as<unsigned>();
        const auto numGroups = count_distinct_groups(groups);
        if (numGroups < minGroups) {
            LOG(WARNING) << "The mapping only has " << numGroups << " groups; no tree can reach " << minGroups;
        }
        const auto filenames = get_input_files(args);
        std::ofstream fileOut;
        std::ostream & out = open_output_stream(args, fileOut);
        auto accept = [&groups, minGroups](const RootedTree & tree) {
            return passes_group_coverage_filter(tree, groups, minGroups);
        };
        const auto counts = filter_tree_files(filenames, parsing_rules_from_options(args), out, accept);
        LOG(INFO) << counts.passed << " of " << counts.attempted << " trees cover at least " << minGroups
                  << " groups (" << counts.parse_failures << " malformed).";
    } catch (std::exception& e) {
        cerr << "twr-filter-groups: Error! " << e.what() << std::endl;
        exit(1);
    }
}
