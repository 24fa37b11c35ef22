#ifndef TREEWRANGLER_NEWICK_H
#define TREEWRANGLER_NEWICK_H
#include <iostream>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "twr/twr_base_includes.h"
#include "twr/tree.h"
#include "twr/newick_tokenizer.h"
#include "twr/error.h"

namespace twr {

// Reads the next ;-terminated tree from `inp`. Returns nullptr when only
//  whitespace (or comments) remain. `pos` is advanced past the tree.
// Throws TWRParsingError (or TWRParsingContentError) for malformed input.
std::unique_ptr<RootedTree> read_next_newick(std::istream &inp,
                                             FilePosStruct & pos,
                                             const ParsingRules &parsingRules);

std::unique_ptr<RootedTree> tree_from_newick_string(const std::string& s,
                                                    const ParsingRules & rules,
                                                    const FilePosStruct & startPos);
std::unique_ptr<RootedTree> tree_from_newick_string(const std::string& s, const ParsingRules & rules);
std::unique_ptr<RootedTree> tree_from_newick_string(const std::string& s);

// Splits a blob holding several trees into one string per statement. Every
//  statement is stripped of surrounding whitespace and ends with ';' (appended
//  to trailing text that lacks one). Blank statements are dropped.
// ';' inside single-quoted labels or [comments] does not split. Quotes and
//  comments do not span lines: at the end of a line any open quote or comment
//  is closed, and a line ending in ';' ends the statement.
// If startPositions is not null, it receives the position of the first
//  character of each statement.
std::vector<std::string> split_newick_statements(const std::string & blob,
                                                 std::vector<FilePosStruct> * startPositions = nullptr,
                                                 ConstStrPtr filepath = nullptr);

// Called by the tree builder for every label / branch length.
void newick_parse_node_info(RootedTree & tree,
                            NodeId node,
                            const NewickTokenizer::Token * labelToken,
                            const NewickTokenizer::Token * brLenToken,
                            const ParsingRules & parsingRules);
// Called when a node is complete (at the "," ")" or ";" that follows it).
void newick_close_node_hook(RootedTree & tree,
                            NodeId node,
                            const NewickTokenizer::Token & token,
                            const ParsingRules & parsingRules);

struct TreeStreamStats {
    std::size_t attempted = 0;       // statements seen
    std::size_t parse_failures = 0;  // statements skipped as malformed
};

using TreeCallback = std::function<bool (std::unique_ptr<RootedTree>, const std::string & statement)>;

// Streams every tree of `filename` to `callback`, with the statement text
//  the tree was read from. A malformed statement is logged, counted in `stats`
//  and skipped; it never stops the remaining trees.
// Returns false if the callback asked to stop.
bool process_trees(const std::string& filename,
                   const ParsingRules& parsingRules,
                   TreeCallback callback,
                   TreeStreamStats * stats = nullptr);

}// namespace twr

#endif
