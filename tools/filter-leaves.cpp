#include <iostream>
#include <fstream>
#include <exception>
#include <vector>
#include <cstdlib>

#include "twr/error.h"
#include "twr/tree.h"
#include "twr/twcli.h"
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
        ("min-leaves,n", value<unsigned>(), "Minimum number of leaves")
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
                                                    "Usage: twr-filter-leaves <newick-file1> <newick-file2> ... --min-leaves N [OPTIONS]\n"
                                                    "Keep the trees with at least N leaves.",
                                                    visible, invisible, p);
    return vm;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc,argv);
        if (not args.count("min-leaves")) {
            throw TWRError() << "Leaf count threshold not specified!  Use --min-leaves=<N>";
        }
        const std::size_t minLeaves = args["min-leaves"].as<unsigned>();
        const auto filenames = get_input_files(args);
        std::ofstream fileOut;
        std::ostream & out = open_output_stream(args, fileOut);
        auto accept = [minLeaves](const RootedTree & tree) {
            return passes_leaf_count_filter(tree, minLeaves);
        };
        const auto counts = filter_tree_files(filenames, parsing_rules_from_options(args), out, accept);
        LOG(INFO) << counts.passed << " of " << counts.attempted << " trees have at least " << minLeaves
                  << " leaves (" << counts.parse_failures << " malformed).";
    } catch (std::exception& e) {
        cerr << "twr-filter-leaves: Error! " << e.what() << std::endl;
        exit(1);
    }
}
