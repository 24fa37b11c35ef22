#include "twr/wgd_stats.h"
#include <iomanip>
#include "twr/monophyly.h"
#include "twr/newick.h"
#include "twr/tree_operations.h"

namespace twr {

const char * wgd_category_name(WGDCategory c) {
    switch (c) {
        case WGDCategory::SKIPPED: return "Skipped";
        case WGDCategory::INDEPENDENT: return "Independent";
        case WGDCategory::SHARED: return "Shared";
        case WGDCategory::UNCERTAIN: return "Uncertain";
    }
    TWR_UNREACHABLE;
}

const char * wgt_category_name(WGTCategory c) {
    switch (c) {
        case WGTCategory::NON_SHARED: return "NonShared";
        case WGTCategory::SHARED: return "Shared";
    }
    TWR_UNREACHABLE;
}

WGDCategory classify_wgd(const RootedTree & tree, const CopySetConfig & config) {
    const auto leaves = get_leaf_names(tree);
    const auto aHere = set_intersection_as_set(config.copies_a, leaves);
    const auto bHere = set_intersection_as_set(config.copies_b, leaves);
    if (aHere.size() < 2 || bHere.size() < 2) {
        return WGDCategory::SKIPPED;
    }
    const bool monoA = is_monophyletic(tree, aHere);
    const bool monoB = is_monophyletic(tree, bHere);
    if (monoA && monoB) {
        return WGDCategory::INDEPENDENT;
    }
    if (!monoA && !monoB) {
        return WGDCategory::SHARED;
    }
    return WGDCategory::UNCERTAIN;
}

WGTCategory classify_wgt(const RootedTree & tree, const CopySetConfig & config) {
    const auto leaves = get_leaf_names(tree);
    const bool monoA = is_monophyletic_in_tree(tree, set_intersection_as_set(config.copies_a, leaves));
    const bool monoB = is_monophyletic_in_tree(tree, set_intersection_as_set(config.copies_b, leaves));
    return (monoA || monoB) ? WGTCategory::NON_SHARED : WGTCategory::SHARED;
}

static inline double as_ratio(std::size_t n, std::size_t d) {
    return (d == 0 ? 0.0 : static_cast<double>(n) / static_cast<double>(d));
}

void WGDSummary::add(WGDCategory c) {
    switch (c) {
        case WGDCategory::SKIPPED:
            skipped += 1;
            return;
        case WGDCategory::INDEPENDENT:
            independent += 1;
            break;
        case WGDCategory::SHARED:
            shared += 1;
            break;
        case WGDCategory::UNCERTAIN:
            uncertain += 1;
            break;
    }
    total += 1;
}

double WGDSummary::independent_ratio() const {
    return as_ratio(independent, total);
}

double WGDSummary::shared_ratio() const {
    return as_ratio(shared, total);
}

void WGTSummary::add(WGTCategory c) {
    if (c == WGTCategory::NON_SHARED) {
        non_shared += 1;
    } else {
        shared += 1;
    }
    total += 1;
}

double WGTSummary::non_shared_ratio() const {
    return as_ratio(non_shared, total);
}

double WGTSummary::shared_ratio() const {
    return as_ratio(shared, total);
}

// Support values are kept in the tree but play no part in classification.
static ParsingRules classification_parsing_rules() {
    ParsingRules rules;
    rules.require_leaf_names = true;
    rules.support_from_internal_labels = true;
    return rules;
}

WGDSummary summarize_wgd_file(const std::string & filename, const CopySetConfig & config) {
    WGDSummary summary;
    summary.filename = filepath_to_filename(filename);
    TreeStreamStats stats;
    auto fn = [&](std::unique_ptr<RootedTree> tree, const std::string &) {
        const auto c = classify_wgd(*tree, config);
        LOG(DEBUG) << tree->get_name() << ": " << wgd_category_name(c);
        summary.add(c);
        return true;
    };
    process_trees(filename, classification_parsing_rules(), fn, &stats);
    summary.attempted = stats.attempted;
    summary.parse_failures = stats.parse_failures;
    LOG(INFO) << summary.filename << ": " << summary.total << " of " << summary.attempted
              << " trees classified (" << summary.skipped << " without enough copies, "
              << summary.parse_failures << " malformed)";
    return summary;
}

WGTSummary summarize_wgt_file(const std::string & filename, const CopySetConfig & config) {
    WGTSummary summary;
    summary.filename = filepath_to_filename(filename);
    TreeStreamStats stats;
    auto fn = [&](std::unique_ptr<RootedTree> tree, const std::string &) {
        const auto c = classify_wgt(*tree, config);
        LOG(DEBUG) << tree->get_name() << ": " << wgt_category_name(c);
        summary.add(c);
        return true;
    };
    process_trees(filename, classification_parsing_rules(), fn, &stats);
    summary.attempted = stats.attempted;
    summary.parse_failures = stats.parse_failures;
    LOG(INFO) << summary.filename << ": " << summary.total << " of " << summary.attempted
              << " trees classified (" << summary.parse_failures << " malformed)";
    return summary;
}

void write_wgd_header(std::ostream & out) {
    out << "File\tAttempted\tTotal\tIndependent\tShared\tUncertain\tInd_Ratio\tShared_Ratio\n";
}

void write_wgd_row(std::ostream & out, const WGDSummary & s) {
    const auto oldFlags = out.flags();
    const auto oldPrecision = out.precision();
    out << s.filename << '\t' << s.attempted << '\t' << s.total << '\t'
        << s.independent << '\t' << s.shared << '\t' << s.uncertain << '\t'
        << std::fixed << std::setprecision(4)
        << s.independent_ratio() << '\t' << s.shared_ratio() << '\n';
    out.flags(oldFlags);
    out.precision(oldPrecision);
}

void write_wgt_header(std::ostream & out) {
    out << "File\tAttempted\tTotal_Trees\tNonShared_Count\tNonShared_Ratio\tShared_Count\tShared_Ratio\n";
}

void write_wgt_row(std::ostream & out, const WGTSummary & s) {
    const auto oldFlags = out.flags();
    const auto oldPrecision = out.precision();
    out << s.filename << '\t' << s.attempted << '\t' << s.total << '\t'
        << s.non_shared << '\t'
        << std::fixed << std::setprecision(4) << s.non_shared_ratio() << '\t'
        << s.shared << '\t' << s.shared_ratio() << '\n';
    out.flags(oldFlags);
    out.precision(oldPrecision);
}

} // namespace twr
