#include "twr/twcli.h"
#include <algorithm>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>
#include <boost/filesystem/operations.hpp>
#include "twr/config_file.h"
#include "twr/error.h"
#include "twr/newick.h"
#include "twr/util.h"

///////////////////////////////////////////////////////////////
// pragmas are to silence clang
#pragma clang diagnostic push
#pragma clang diagnostic ignored  "-Wglobal-constructors"
#pragma clang diagnostic ignored  "-Wexit-time-destructors"
INITIALIZE_EASYLOGGINGPP
#pragma clang diagnostic pop
///////////////////////////////////////////////////////////////

namespace po = boost::program_options;
namespace fs = boost::filesystem;
using po::variables_map;
using std::string;
using std::vector;

namespace twr {
bool debugging_output_enabled = false;

po::options_description standard_options()
{
    using namespace po;
    options_description standard("Standard command-line flags");
    standard.add_options()
      ("help,h", "Produce help message")
      ("response-file,f", value<string>(), "Treat contents of file <arg> as a command line.")
      ("quiet,q","QUIET mode (all logging disabled)")
      ("trace,t","TRACE level debugging (very noisy)")
      ("verbose,v","verbose")
    ;
    return standard;
}

variables_map cmd_line_set_logging(const po::variables_map& vm)
{
    el::Configurations defaultConf;
    defaultConf.setToDefault();
    defaultConf.set(el::Level::Global, el::ConfigurationType::ToFile, "false");
    if (vm.count("quiet"))
        defaultConf.set(el::Level::Global,  el::ConfigurationType::Enabled, "false");
    else
    {
        defaultConf.set(el::Level::Trace, el::ConfigurationType::Enabled, "false");
        defaultConf.set(el::Level::Debug, el::ConfigurationType::Enabled, "false");

        if (vm.count("trace"))
            defaultConf.set(el::Level::Trace, el::ConfigurationType::Enabled, "true");

        if (vm.count("verbose")) {
            defaultConf.set(el::Level::Debug, el::ConfigurationType::Enabled, "true");
            debugging_output_enabled = true;
        }
    }
    el::Loggers::reconfigureLogger("default", defaultConf);

    return vm;
}

vector<string> cmd_line_response_file_contents(const po::variables_map& vm)
{
    vector<string> args;
    if (vm.count("response-file"))
    {
        // Load the file and tokenize it
        const auto & fp = vm["response-file"].as<string>();
        std::ifstream ifs(fp.c_str());
        if (not ifs)
            throw TWRError() << "Could not open the response file \"" << fp << "\"";
        std::stringstream ss;
        ss << ifs.rdbuf();
        boost::char_separator<char> sep(" \t\n\r");
        std::string responseFileContents(ss.str());
        boost::tokenizer<boost::char_separator<char> > tok(responseFileContents, sep);
        copy(tok.begin(), tok.end(), back_inserter(args));
    }
    return args;
}

variables_map parse_cmd_line_response_file(int argc, char* argv[],
                                           po::options_description visible,
                                           po::options_description invisible,
                                           po::positional_options_description p)
{
    using namespace po;
    variables_map vm;
    options_description all;
    all.add(invisible).add(visible);
    store(command_line_parser(argc, argv).options(all).positional(p).run(), vm);
    notify(vm);

    std::vector<string> args = cmd_line_response_file_contents(vm);
    store(command_line_parser(args).options(all).positional(p).run(), vm);
    notify(vm);

    return vm;
}

variables_map parse_cmd_line_standard(int argc, char* argv[],
                                      const string& message,
                                      po::options_description visible,
                                      po::options_description invisible,
                                      po::positional_options_description p)
{
    using namespace po;

    variables_map vm = parse_cmd_line_response_file(argc, argv, visible, invisible, p);

    if (vm.count("help")) {
        std::cout<<message<<"\n";
        std::cout<<visible<<"\n";
        if (vm.count("verbose"))
            std::cout<<invisible<<"\n";
        exit(0);
    }

    cmd_line_set_logging(vm);

    return vm;
}

vector<string> nwk_files_in_directory(const string & dir) {
    vector<string> r;
    for (const auto & entry : fs::directory_iterator(fs::path(dir))) {
        const auto & p = entry.path();
        if (fs::is_regular_file(p) && p.extension() == ".nwk") {
            r.push_back(p.string());
        }
    }
    std::sort(r.begin(), r.end());
    return r;
}

vector<string> get_input_files(const po::variables_map& vm) {
    vector<string> filenames;
    if (vm.count("input")) {
        filenames = vm["input"].as<vector<string> >();
    } else {
        filenames = nwk_files_in_directory(".");
        LOG(INFO) << "No tree files given; found " << filenames.size() << " .nwk file(s) in the current directory.";
    }
    if (filenames.empty()) {
        throw TWRError() << "No tree files to read.";
    }
    for (const auto & f : filenames) {
        if (not fs::is_regular_file(fs::path(f))) {
            throw TWRError() << "\"" << f << "\" is not a readable file.";
        }
    }
    return filenames;
}

std::ostream & open_output_stream(const po::variables_map& vm, std::ofstream & fileOut) {
    if (not vm.count("out")) {
        return std::cout;
    }
    const auto & fp = vm["out"].as<string>();
    if (fp == "-") {
        return std::cout;
    }
    const auto parent = fs::path(fp).parent_path();
    if (not parent.empty() and not fs::is_directory(parent)) {
        throw TWRError() << "The directory \"" << parent.string() << "\" for the output file does not exist.";
    }
    fileOut.open(fp);
    if (not fileOut.good()) {
        throw TWRError() << "Could not open \"" << fp << "\" for writing.";
    }
    LOG(INFO) << "writing to \"" << fp << "\"";
    return fileOut;
}

vector<string> config_file_list(const po::variables_map& vm) {
    vector<string> files;
    if (vm.count("config")) {
        files.push_back(vm["config"].as<string>());
    }
    if (auto dot = dot_treewrangler()) {
        files.push_back(*dot);
    }
    return files;
}

FilterCounts filter_tree_files(const vector<string> & filenames,
                               const ParsingRules & rules,
                               std::ostream & out,
                               const std::function<bool (const RootedTree &)> & accept) {
    FilterCounts counts;
    for (const auto & filename : filenames) {
        TreeStreamStats stats;
        std::size_t passedHere = 0;
        auto fn = [&](std::unique_ptr<RootedTree> tree, const string & statement) {
            if (accept(*tree)) {
                out << statement << '\n';
                passedHere += 1;
            } else {
                LOG(DEBUG) << tree->get_name() << " rejected";
            }
            return true;
        };
        process_trees(filename, rules, fn, &stats);
        LOG(INFO) << filepath_to_filename(filename) << ": " << passedHere << " of " << stats.attempted
                  << " trees passed (" << stats.parse_failures << " malformed)";
        counts.attempted += stats.attempted;
        counts.parse_failures += stats.parse_failures;
        counts.passed += passedHere;
    }
    return counts;
}

static NameSet copy_set_from_options(const po::variables_map& vm,
                                     const vector<string> & configs,
                                     const string & section,
                                     const string & flag,
                                     const string & key) {
    if (vm.count(flag)) {
        NameSet names;
        for (const auto & arg : vm[flag].as<vector<string> >()) {
            for (const auto & n : parse_delim_separated_names(arg, ',')) {
                names.insert(n);
            }
        }
        return names;
    }
    if (auto fromConfig = load_name_set_config(configs, section, key)) {
        return *fromConfig;
    }
    throw TWRError() << "No gene copies given!  Use --" << flag << "=<name1,name2> or \"" << key
                     << "\" in the [" << section << "] section of a config file.";
}

CopySetConfig copy_sets_from_options(const po::variables_map& vm, const string & section) {
    const auto configs = config_file_list(vm);
    CopySetConfig config;
    config.copies_a = copy_set_from_options(vm, configs, section, "copies-a", "copies_a");
    config.copies_b = copy_set_from_options(vm, configs, section, "copies-b", "copies_b");
    if (config.copies_a.empty() || config.copies_b.empty()) {
        throw TWRError() << "Both sets of gene copies must name at least one leaf.";
    }
    const auto overlap = set_intersection_as_set(config.copies_a, config.copies_b);
    if (not overlap.empty()) {
        throw TWRError() << "\"" << *overlap.begin() << "\" is listed as a copy of both species.";
    }
    LOG(DEBUG) << config.copies_a.size() << " copies of A and " << config.copies_b.size() << " copies of B";
    return config;
}

ParsingRules parsing_rules_from_options(const po::variables_map& vm) {
    ParsingRules rules;
    if (vm.count("no-support-labels")) {
        rules.support_from_internal_labels = false;
    }
    return rules;
}

} // namespace twr
