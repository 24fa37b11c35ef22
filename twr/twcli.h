#if !defined TREEWRANGLER_TWCLI_H
#define TREEWRANGLER_TWCLI_H
// Command-line plumbing shared by the twr-* tools.
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include <boost/tokenizer.hpp>
#include <boost/program_options.hpp>
#include "twr/twr_base_includes.h"
#include "twr/newick_tokenizer.h"
#include "twr/tree.h"
#include "twr/wgd_stats.h"

namespace twr {

boost::program_options::options_description standard_options();

boost::program_options::variables_map cmd_line_set_logging(const boost::program_options::variables_map& vm);

std::vector<std::string> cmd_line_response_file_contents(const boost::program_options::variables_map& vm);

boost::program_options::variables_map parse_cmd_line_response_file(int argc, char* argv[],
                                                                   boost::program_options::options_description visible,
                                                                   boost::program_options::options_description invisible,
                                                                   boost::program_options::positional_options_description p);

boost::program_options::variables_map parse_cmd_line_standard(int argc, char* argv[],
                                                              const std::string& message,
                                                              boost::program_options::options_description visible,
                                                              boost::program_options::options_description invisible,
                                                              boost::program_options::positional_options_description p);

// sorted *.nwk regular files of `dir`
std::vector<std::string> nwk_files_in_directory(const std::string & dir);

// the positional "input" files, or every *.nwk file of the working directory
//  if none were given. Throws TWRError if there is nothing to read.
std::vector<std::string> get_input_files(const boost::program_options::variables_map& vm);

// std::cout unless the "out" option names a file, which is then opened
//  through `fileOut`.
std::ostream & open_output_stream(const boost::program_options::variables_map& vm, std::ofstream & fileOut);

// config files named by --config, then ~/.treewrangler if it exists
std::vector<std::string> config_file_list(const boost::program_options::variables_map& vm);

struct FilterCounts {
    std::size_t attempted = 0;
    std::size_t parse_failures = 0;
    std::size_t passed = 0;
};

// Streams the trees of every file through `accept`; the statement text of each
//  accepted tree is written to `out`, one per line. Malformed trees are
//  skipped and counted.
FilterCounts filter_tree_files(const std::vector<std::string> & filenames,
                               const ParsingRules & rules,
                               std::ostream & out,
                               const std::function<bool (const RootedTree &)> & accept);

// --copies-a / --copies-b (comma-separated), else copies_a / copies_b of
//  `section` in the config files. Throws TWRError unless both sets are
//  non-empty and disjoint.
CopySetConfig copy_sets_from_options(const boost::program_options::variables_map& vm, const std::string & section);

// Parsing rules from --no-support-labels
ParsingRules parsing_rules_from_options(const boost::program_options::variables_map& vm);

} // namespace twr
#endif
