#include <vector>
#include "twr/config_file.h"
#include "twr/twcli.h"
#include "twr/util.h"
#include "twr/test_harness.h"
using namespace twr;

namespace po = boost::program_options;

static po::variables_map copy_set_args(const std::vector<std::string> & args) {
    po::options_description desc;
    desc.add_options()
        ("copies-a,a", po::value<std::vector<std::string> >()->composing(), "")
        ("copies-b,b", po::value<std::vector<std::string> >()->composing(), "")
        ("config,c", po::value<std::string>(), "")
        ;
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(desc).run(), vm);
    po::notify(vm);
    return vm;
}

char test_name_sets(const TestHarness & h) {
    const std::vector<std::string> files = {h.get_filepath("treewrangler.ini")};
    const auto a = load_name_set_config(files, "wgd", "copies_a");
    if (!a || *a != NameSet{"1", "2"}) {
        return 'F';
    }
    const auto b = load_name_set_config(files, "wgd", "copies_b");
    return (b && *b == NameSet{"3", "4"} ? '.' : 'F');
}

char test_interpolation(const TestHarness & h) {
    const std::vector<std::string> files = {h.get_filepath("treewrangler.ini")};
    const auto a = load_name_set_config(files, "wgt", "copies_a");
    return (a && *a == NameSet{"1", "2", "3"} ? '.' : 'F');
}

char test_literal_percent_and_nesting(const TestHarness & h) {
    const std::vector<std::string> files = {h.get_filepath("treewrangler.ini")};
    const auto pct = load_config(files, "misc", "pct");
    if (!pct || *pct != "50%") {
        return 'F';
    }
    const auto ref = load_config(files, "misc", "pct_ref");
    if (!ref || *ref != "50% done") {
        return 'F';
    }
    const auto top = load_name_set_config(files, "misc", "top");
    return (top && *top == NameSet{"a", "b", "c"} ? '.' : 'F');
}

char test_missing_section_or_key(const TestHarness & h) {
    const std::vector<std::string> files = {h.get_filepath("treewrangler.ini")};
    if (load_config(files, "nothing", "copies_a")) {
        return 'F';
    }
    return (load_config(files, "wgd", "nothing") ? 'F' : '.');
}

char test_numbers(const TestHarness & h) {
    const std::vector<std::string> files = {h.get_filepath("treewrangler.ini")};
    const auto s = load_double_config(files, "support", "min_support");
    if (!s || !test_double_equality(0.9, *s)) {
        return 'F';
    }
    try {
        load_double_config(files, "support", "min_branch");
    } catch (const TWRError &) {
        return '.';
    }
    return 'F';
}

char test_copy_sets_from_config(const TestHarness & h) {
    const auto vm = copy_set_args({"--config", h.get_filepath("treewrangler.ini")});
    const auto wgd = copy_sets_from_options(vm, "wgd");
    if (wgd.copies_a != NameSet{"1", "2"} || wgd.copies_b != NameSet{"3", "4"}) {
        return 'F';
    }
    const auto wgt = copy_sets_from_options(vm, "wgt");
    return (wgt.copies_b == NameSet{"4", "5", "6"} ? '.' : 'F');
}

char test_command_line_overrides_config(const TestHarness & h) {
    const auto vm = copy_set_args({"--config", h.get_filepath("treewrangler.ini"),
                                   "--copies-a", "x, y", "-a", "z"});
    const auto c = copy_sets_from_options(vm, "wgd");
    if (c.copies_a != NameSet{"x", "y", "z"}) {
        return 'F';
    }
    return (c.copies_b == NameSet{"3", "4"} ? '.' : 'F');
}

char test_overlapping_copies_rejected(const TestHarness &) {
    const auto vm = copy_set_args({"--copies-a", "1,2", "--copies-b", "2,3"});
    try {
        copy_sets_from_options(vm, "wgd");
    } catch (const TWRError & x) {
        return (std::string(x.what()).find("\"2\"") != std::string::npos ? '.' : 'F');
    }
    return 'F';
}

char test_empty_copies_rejected(const TestHarness &) {
    const auto vm = copy_set_args({"--copies-a", " , ", "--copies-b", "3"});
    try {
        copy_sets_from_options(vm, "wgd");
    } catch (const TWRError &) {
        return '.';
    }
    return 'F';
}

char test_nwk_files_in_directory(const TestHarness & h) {
    std::vector<std::string> names;
    for (const auto & f : nwk_files_in_directory(h.get_filepath(""))) {
        names.push_back(filepath_to_filename(f));
    }
    const std::vector<std::string> expected = {"bad-quote.nwk", "mixed.nwk", "wgd-trees.nwk", "wgt-trees.nwk"};
    return (test_vec_element_equality(expected, names) ? '.' : 'F');
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_name_sets", test_name_sets)
                   , TestFn("test_interpolation", test_interpolation)
                   , TestFn("test_literal_percent_and_nesting", test_literal_percent_and_nesting)
                   , TestFn("test_missing_section_or_key", test_missing_section_or_key)
                   , TestFn("test_numbers", test_numbers)
                   , TestFn("test_copy_sets_from_config", test_copy_sets_from_config)
                   , TestFn("test_command_line_overrides_config", test_command_line_overrides_config)
                   , TestFn("test_overlapping_copies_rejected", test_overlapping_copies_rejected)
                   , TestFn("test_empty_copies_rejected", test_empty_copies_rejected)
                   , TestFn("test_nwk_files_in_directory", test_nwk_files_in_directory)
                  };
    return th.run_tests(tests);
}
