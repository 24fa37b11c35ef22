#include <iostream>
#include <fstream>
#include <exception>
#include <vector>
#include <cstdlib>

#include "twr/error.h"
#include "twr/tree.h"
#include "twr/twcli.h"
#include "twr/newick.h"
#include "twr/newick_writer.h"
#include "twr/prune.h"
#include "twr/util.h"

using namespace twr;

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using std::unique_ptr;

namespace po = boost::program_options;
using po::variables_map;

variables_map parse_cmd_line(int argc,char* argv[]) {
    using namespace po;

    // named options
    options_description invisible("Invisible options");
    invisible.add_options()
        ("input", value<vector<string>>()->composing(),"Filenames for newick trees")
        ;

    options_description prune("Pruning options");
    prune.add_options()
        ("remove,r", value<vector<string>>()->composing(), "Comma-separated names of nodes to remove (may be repeated)")
        ("remove-file", value<string>(), "File with the name of a node to remove on each line")
        ("no-support-labels", "Treat numeric internal labels as names rather than support values")
        ;

    options_description output("Output options");
    output.add_options()
        ("out,o", value<string>(), "Output newick file (default: standard output)")
        ("precision", value<int>()->default_value(10), "Digits after the decimal point for branch lengths")
        ("write-support", "Write support values of internal nodes")
        ("no-internal-names", "Do not write the names of internal nodes")
        ;

    options_description visible;
    visible.add(prune).add(output).add(twr::standard_options());

    // positional options
    positional_options_description p;
    p.add("input", -1);

    variables_map vm = twr::parse_cmd_line_standard(argc, argv,
                                                    "Usage: twr-prune-nodes <newick-file1> <newick-file2> ... --remove NAME[,NAME...] [OPTIONS]\n"
                                                    "Remove named nodes from every tree. A node with a single sibling is\n"
                                                    "replaced by that sibling, whose branch length absorbs the parent's.",
                                                    visible, invisible, p);
    return vm;
}

vector<string> names_to_remove(const variables_map & args) {
    vector<string> names;
    if (args.count("remove")) {
        for (const auto & arg : args["remove"].as<vector<string>>()) {
            for (const auto & n : parse_delim_separated_names(arg, ',')) {
                names.push_back(n);
            }
        }
    }
    if (args.count("remove-file")) {
        for (const auto & line : read_lines_of_file(args["remove-file"].as<string>())) {
            names.push_back(line);
        }
    }
    return names;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc,argv);
        const auto names = names_to_remove(args);
        if (names.empty()) {
            throw TWRError() << "No node names given!  Use --remove=<name1,name2> or --remove-file=<file>";
        }
        const auto filenames = get_input_files(args);
        NewickWriteOptions writeOpts;
        writeOpts.branch_precision = args["precision"].as<int>();
        if (writeOpts.branch_precision < 0) {
            throw TWRError() << "--precision must not be negative";
        }
        writeOpts.write_support = args.count("write-support") > 0;
        writeOpts.write_internal_names = args.count("no-internal-names") == 0;
        const auto rules = parsing_rules_from_options(args);

        std::ofstream fileOut;
        std::ostream & out = open_output_stream(args, fileOut);
        std::size_t numTrees = 0;
        std::size_t numRemoved = 0;
        std::size_t numFailures = 0;
        for (const auto & filename : filenames) {
            TreeStreamStats stats;
            auto fn = [&](unique_ptr<RootedTree> tree, const string &) {
                db_write_newick(*tree);
                const auto report = prune_named_nodes(*tree, names);
                LOG(DEBUG) << tree->get_name() << ": removed " << report.num_removed << " node(s), "
                           << report.num_reconnections << " reconnection(s)";
                numRemoved += report.num_removed;
                write_newick(out, *tree, writeOpts);
                out << '\n';
                numTrees += 1;
                return true;
            };
            process_trees(filename, rules, fn, &stats);
            numFailures += stats.parse_failures;
        }
        LOG(INFO) << numTrees << " tree(s) written; " << numRemoved << " node(s) removed; "
                  << numFailures << " malformed tree(s) skipped.";
    } catch (std::exception& e) {
        cerr << "twr-prune-nodes: Error! " << e.what() << std::endl;
        exit(1);
    }
}
