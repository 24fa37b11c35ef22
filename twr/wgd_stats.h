#ifndef TREEWRANGLER_WGD_STATS_H
#define TREEWRANGLER_WGD_STATS_H
// Classification of gene-copy trees after whole-genome duplication (WGD,
//  2 copies per species) or triplication (WGT, 3 copies per species), and
//  per-file aggregation of the classes.
// Depends on: monophyly.h newick.h
// Depended on by: tools/wgd-stats.cpp tools/wgt-stats.cpp
#include <iostream>
#include <string>
#include "twr/twr_base_includes.h"
#include "twr/tree.h"

namespace twr {

// gene copies of species A and of species B
struct CopySetConfig {
    NameSet copies_a;
    NameSet copies_b;
};

enum class WGDCategory {
    SKIPPED,      // fewer than 2 copies of A or of B present
    INDEPENDENT,  // both sets of copies are clades
    SHARED,       // neither is
    UNCERTAIN     // exactly one is
};

enum class WGTCategory {
    NON_SHARED,   // copies of A or copies of B form a clade
    SHARED
};

const char * wgd_category_name(WGDCategory c);
const char * wgt_category_name(WGTCategory c);

WGDCategory classify_wgd(const RootedTree & tree, const CopySetConfig & config);
// sets of present copies with fewer than 2 members count as clades
WGTCategory classify_wgt(const RootedTree & tree, const CopySetConfig & config);

// counts for one input file
struct WGDSummary {
    std::string filename;
    std::size_t attempted = 0;
    std::size_t parse_failures = 0;
    std::size_t skipped = 0;
    std::size_t total = 0;   // trees classified
    std::size_t independent = 0;
    std::size_t shared = 0;
    std::size_t uncertain = 0;
    void add(WGDCategory c);
    double independent_ratio() const;
    double shared_ratio() const;
};

struct WGTSummary {
    std::string filename;
    std::size_t attempted = 0;
    std::size_t parse_failures = 0;
    std::size_t total = 0;
    std::size_t non_shared = 0;
    std::size_t shared = 0;
    void add(WGTCategory c);
    double non_shared_ratio() const;
    double shared_ratio() const;
};

WGDSummary summarize_wgd_file(const std::string & filename, const CopySetConfig & config);
WGTSummary summarize_wgt_file(const std::string & filename, const CopySetConfig & config);

void write_wgd_header(std::ostream & out);
void write_wgd_row(std::ostream & out, const WGDSummary & summary);
void write_wgt_header(std::ostream & out);
void write_wgt_row(std::ostream & out, const WGTSummary & summary);

} // namespace twr
#endif
