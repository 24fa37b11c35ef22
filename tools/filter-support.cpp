#include <iostream>
#include <fstream>
#include <exception>
#include <vector>
#include <cstdlib>

#include "twr/error.h"
#include "twr/tree.h"
#include "twr/twcli.h"
#include "twr/config_file.h"
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
        ("min-support", value<double>(), "Minimum support of every annotated internal node (default 0.7)")
        ("min-branch", value<double>(), "Minimum branch length of every annotated internal node (default 0.01)")
        ("config,c", value<string>(), "Config file with a [support] section (min_support, min_branch)")
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
                                                    "Usage: twr-filter-support <newick-file1> <newick-file2> ... [OPTIONS]\n"
                                                    "Keep the trees whose annotated internal nodes all reach the support and\n"
                                                    "branch length thresholds. Trees without annotated internal nodes are dropped.",
                                                    visible, invisible, p);
    return vm;
}

// command line, then config file, then the built-in default
SupportFilter get_support_filter(const variables_map & args) {
    SupportFilter filter;
    const auto configs = config_file_list(args);
    if (args.count("min-support")) {
        filter.min_support = args["min-support"].as<double>();
    } else if (auto v = load_double_config(configs, "support", "min_support")) {
        filter.min_support = *v;
    }
    if (args.count("min-branch")) {
        filter.min_branch = args["min-branch"].as<double>();
    } else if (auto v = load_double_config(configs, "support", "min_branch")) {
        filter.min_branch = *v;
    }
    return filter;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc,argv);
        const auto filter = get_support_filter(args);
        const auto filenames = get_input_files(args);
        LOG(INFO) << "keeping trees with support >= " << filter.min_support << " and branch length >= " << filter.min_branch;
        std::ofstream fileOut;
        std::ostream & out = open_output_stream(args, fileOut);
        ParsingRules rules;
        auto accept = [&filter](const RootedTree & tree) {
            return passes_support_filter(tree, filter);
        };
        const auto counts = filter_tree_files(filenames, rules, out, accept);
        LOG(INFO) << counts.passed << " of " << counts.attempted << " trees retained ("
                  << counts.parse_failures << " malformed).";
    } catch (std::exception& e) {
        cerr << "twr-filter-support: Error! " << e.what() << std::endl;
        exit(1);
    }
}
