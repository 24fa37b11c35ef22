#include <iostream>
#include <fstream>
#include <exception>
#include <functional>
#include <vector>
#include <cstdlib>

#include "twr/error.h"
#include "twr/twcli.h"
#include "twr/batch.h"
#include "twr/wgd_stats.h"

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
        ("input", value<vector<string>>()->composing(),"Filenames for newick trees (default: *.nwk)")
        ;

    options_description copies("Gene copy options");
    copies.add_options()
        ("copies-a,a", value<vector<string>>()->composing(), "Comma-separated leaf names of the copies in species A")
        ("copies-b,b", value<vector<string>>()->composing(), "Comma-separated leaf names of the copies in species B")
        ("config,c", value<string>(), "Config file with copies_a / copies_b in a [wgt] section")
        ;

    options_description output("Output options");
    output.add_options()
        ("out,o", value<string>()->default_value("WGT_support_summary.txt"), "Summary table (- for standard output)")
        ("jobs,j", value<unsigned>()->default_value(1), "Number of files to process at once")
        ;

    options_description visible;
    visible.add(copies).add(output).add(twr::standard_options());

    positional_options_description p;
    p.add("input", -1);

    variables_map vm = twr::parse_cmd_line_standard(argc, argv,
                                                    "Usage: twr-wgt-stats [<newick-file1> <newick-file2> ...] [OPTIONS]\n"
                                                    "Classify gene trees with three copies per species after a whole-genome triplication:\n"
                                                    "  NonShared: the copies of species A or of species B form a clade\n"
                                                    "  Shared: the copies of the two species are intermingled\n"
                                                    "Every tree is counted; one copy (or none) of a species counts as a clade.",
                                                    visible, invisible, p);
    return vm;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc,argv);
        const auto config = copy_sets_from_options(args, "wgt");
        const auto filenames = get_input_files(args);
        std::function<WGTSummary (const string &)> fn = [&config](const string & filename) {
            return summarize_wgt_file(filename, config);
        };
        const auto summaries = map_files_in_parallel(filenames, args["jobs"].as<unsigned>(), fn);
        std::ofstream fileOut;
        std::ostream & out = open_output_stream(args, fileOut);
        write_wgt_header(out);
        for (const auto & s : summaries) {
            write_wgt_row(out, s);
        }
        out.flush();
        LOG(INFO) << "Summarized " << summaries.size() << " file(s).";
    } catch (std::exception& e) {
        cerr << "twr-wgt-stats: Error! " << e.what() << std::endl;
        exit(1);
    }
}
