#include "twr/newick.h"
#include <cstring>
#include <stack>
#include <string>
namespace twr {

static const char * _EARLY_SEMICOLON = "Unexpected ; with open parentheses not balanced.";
static const char * _ILL_AFTER_CLOSE = "Illegal character after \")\" character. Expecting \",\" or a label or a colon.";
static const char * _ILL_AFTER_LABEL = "Illegal character after label. Expecting ( or a label.";
static const char * _ILL_AFTER_BRANCH_INFO = "Illegal character after branch info. Expecting \",\" or \")\" or \";\".";
static const char * _ILL_AFTER_OPEN = "Illegal character after \"(\" character. Expecting ( or a label.";
static const char * _ILL_AFTER_COMMA = "Illegal character after \",\" character. Expecting ( or a label.";
static const char * _ILL_AFTER_COLON = "Illegal character after \":\" character. Expecting a branch length.";
static const char * _ILL_NO_SEMICOLON = "Expecting ; after a newick description.";
static const char * _ILL_FIRST_CHAR = "Expecting a newick tree to start with \"(\" or a label.";
static const char * _EOF_IN_LABEL = "Unexpected EOF in label. Expecting a ; to end a newick.";
static const char * _NEWICK_DELIMS = "(),:;";

// isspace() is not used so that bytes of multi-byte UTF-8 characters are
//  treated as label content.
static inline bool is_newick_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static inline bool is_newick_delim(char c) {
    return c != '\0' && std::strchr(_NEWICK_DELIMS, c) != nullptr;
}

// Called with the character that ended a label still unread. Runs of
//  whitespace inside a label collapse to one space; whitespace before a
//  delimiter is dropped.
void NewickTokenizer::iterator::on_label_exit() {
    char n;
    if (!advance_reader_one_logical_char(n)) {
        throw TWRParsingError(_EOF_IN_LABEL, '\0', this->current_pos);
    }
    bool whitespaceFound = false;
    if (is_newick_space(n)) {
        whitespaceFound = true;
        if (!advance_to_next_non_whitespace(n)) {
            throw TWRParsingError(_EOF_IN_LABEL, '\0', this->current_pos);
        }
    }
    if (is_newick_delim(n)) {
        this->push(n);
        return;
    }
    if (n == '[') {
        finish_reading_comment();
        on_label_exit();
        return;
    }
    if (whitespaceFound) {
        this->current_word += ' ';
    }
    if (n == '\'') {
        LOG(DEBUG) << "Quoted string continues a label. " << this->current_pos.describe();
        finish_reading_quoted_str();
        return;
    }
    this->current_word += n;
    finish_reading_unquoted();
}

void NewickTokenizer::iterator::finish_reading_quoted_str() {
    for (;;) {
        char c;
        if (!advance_reader_one_logical_char(c)) {
            throw TWRParsingError("Unexpected EOF in quoted string", '\0', this->current_pos);
        }
        if (c == '\'') {
            char n;
            if (!advance_reader_one_logical_char(n)) {
                throw TWRParsingError("Unexpected EOF at the end of a quoted string. Expecting ; if this is the end of the tree.", '\0', this->current_pos);
            }
            if (n == '\'') {
                this->current_word += c;
            } else {
                this->push(n);
                if (!is_newick_delim(n)) {
                    this->on_label_exit();
                }
                return;
            }
        } else {
            this->current_word += c;
        }
    }
}

// Underscores are label content, not encoded blanks.
void NewickTokenizer::iterator::finish_reading_unquoted() {
    for (;;) {
        char c;
        if (!advance_reader_one_logical_char(c)) {
            throw TWRParsingError(_EOF_IN_LABEL, '\0', this->current_pos);
        }
        if (is_newick_space(c)) {
            this->push(c);
            this->on_label_exit();
            return;
        }
        if (is_newick_delim(c)) {
            this->push(c);
            return;
        }
        if (c == '\'') {
            LOG(WARNING) << "single-quoted string found in unquoted label. " << this->current_pos.describe();
            this->finish_reading_quoted_str();
            return;
        } else if (c == '[') {
            finish_reading_comment();
        } else {
            this->current_word += c;
        }
    }
}

void NewickTokenizer::iterator::finish_reading_comment() {
    auto numOpenComments = 1U;
    for (;;) {
        char c;
        if (!advance_reader_one_logical_char(c)) {
            throw TWRParsingError("Unexpected EOF in comment", '\0', this->current_pos);
        }
        if (c == ']') {
            numOpenComments -= 1;
            if (numOpenComments == 0) {
                return;
            }
        } else if (c == '[') {
            numOpenComments += 1;
        }
    }
}

bool NewickTokenizer::iterator::advance_to_next_non_whitespace(char & c) {
    for (;;) {
        if (!advance_reader_one_logical_char(c)) {
            return false;
        }
        if (!is_newick_space(c)) {
            return true;
        }
    }
}

void NewickTokenizer::iterator::throw_scc_err(char n) const {
    switch (this->previous_token_state) {
        case NWK_OPEN:
            throw TWRParsingError(_ILL_AFTER_OPEN, n, this->current_pos);
        case NWK_COLON:
            throw TWRParsingError(_ILL_AFTER_COLON, n, this->current_pos);
        case NWK_COMMA:
            throw TWRParsingError(_ILL_AFTER_COMMA, n, this->current_pos);
        case NWK_NOT_IN_TREE:
            throw TWRParsingError(_ILL_FIRST_CHAR, n, this->current_pos);
        default:
            throw TWRParsingError("Unexpected character.", n, this->current_pos);
    }
}

void NewickTokenizer::iterator::consume_next_token() {
    char n;
    // loops past comments
    for (;;) {
        if (!advance_to_next_non_whitespace(n)) {
            if (this->previous_token_state == NWK_NOT_IN_TREE || this->previous_token_state == NWK_SEMICOLON) {
                this->at_end = true;
                return;
            }
            if (this->num_unclosed_parens > 0) {
                throw TWRParsingError("Unexpected EOF while tree was still being read more open parentheses than closed parentheses read.", '\0', this->current_pos);
            }
            throw TWRParsingError("Unexpected EOF. Semicolon expected at the end of the newick.", '\0', this->current_pos);
        }
        LOG(TRACE) << "in consume_next_token with n =\"" << n << "\"";
        if (n == '[') {
            this->finish_reading_comment();
            continue;
        }
        if (n == '\'' || std::strchr(_NEWICK_DELIMS, n) == nullptr) {
            if (this->previous_token_state == NWK_BRANCH_INFO) {
                throw TWRParsingError(_ILL_AFTER_BRANCH_INFO, n, this->current_pos);
            }
            if (this->previous_token_state == NWK_LABEL) {
                throw TWRParsingError(_ILL_AFTER_LABEL, n, this->current_pos);
            }
            const auto s = (this->previous_token_state == NWK_COLON ? NWK_BRANCH_INFO : NWK_LABEL);
            if (n == '\'') {
                this->start_token(s, n);
                this->current_word.clear();
                this->finish_reading_quoted_str();
            } else {
                this->start_token(s, n);
                this->finish_reading_unquoted();
            }
            return;
        }
        switch (n) {
        case '(':
            if (this->previous_token_state == NWK_LABEL) {
                throw TWRParsingError(_ILL_AFTER_LABEL, n, this->current_pos);
            }
            if (this->previous_token_state == NWK_BRANCH_INFO) {
                throw TWRParsingError(_ILL_AFTER_BRANCH_INFO, n, this->current_pos);
            }
            if (this->previous_token_state == NWK_CLOSE) {
                throw TWRParsingError(_ILL_AFTER_CLOSE, n, this->current_pos);
            }
            if (this->previous_token_state == NWK_COLON) {
                throw TWRParsingError(_ILL_AFTER_COLON, n, this->current_pos);
            }
            if (this->previous_token_state != NWK_NOT_IN_TREE && this->num_unclosed_parens <= 0) {
                throw TWRParsingError(_ILL_NO_SEMICOLON, n, this->current_pos);
            }
            this->num_unclosed_parens += 1;
            this->start_token(NWK_OPEN, n);
            return;
        case ')':
            if (this->previous_token_state == NWK_OPEN
                || this->previous_token_state == NWK_COMMA
                || this->previous_token_state == NWK_COLON
                || this->previous_token_state == NWK_NOT_IN_TREE) {
                this->throw_scc_err(n);
            }
            if (this->num_unclosed_parens <= 0) {
                throw TWRParsingError("Too many close parentheses", n, this->current_pos);
            }
            this->num_unclosed_parens -= 1;
            this->start_token(NWK_CLOSE, n);
            return;
        case ',':
            if (this->previous_token_state == NWK_OPEN
                || this->previous_token_state == NWK_COMMA
                || this->previous_token_state == NWK_COLON
                || this->previous_token_state == NWK_NOT_IN_TREE) {
                this->throw_scc_err(n);
            }
            if (this->num_unclosed_parens <= 0) {
                throw TWRParsingError(_ILL_NO_SEMICOLON, n, this->current_pos);
            }
            this->start_token(NWK_COMMA, n);
            return;
        case ':':
            if (this->previous_token_state == NWK_LABEL || this->previous_token_state == NWK_CLOSE) {
                this->start_token(NWK_COLON, n);
                return;
            }
            if (this->previous_token_state == NWK_BRANCH_INFO) {
                throw TWRParsingError(_ILL_AFTER_BRANCH_INFO, n, this->current_pos);
            }
            this->throw_scc_err(n);
        case ';':
            if (this->num_unclosed_parens != 0) {
                throw TWRParsingError(_EARLY_SEMICOLON, n, this->current_pos);
            }
            if (this->previous_token_state == NWK_LABEL
                || this->previous_token_state == NWK_BRANCH_INFO
                || this->previous_token_state == NWK_CLOSE) {
                this->start_token(NWK_SEMICOLON, n);
                return;
            }
            this->throw_scc_err(n);
        default:
            TWR_UNREACHABLE;
        }
    }
}

//////////////////////////////////////////////////////////////////////////////
// tree building

void newick_close_node_hook(RootedTree & tree,
                            NodeId node,
                            const NewickTokenizer::Token & token,
                            const ParsingRules & parsingRules) {
    const auto & nd = tree.get_node(node);
    if (nd.is_tip() && parsingRules.require_leaf_names && !nd.has_name()) {
        throw TWRParsingContentError("Expecting every leaf to have a name.", token.get_start_pos());
    }
}

// A label on an internal node may be a support value ("0.95"), a name
//  ("Clade1") or a name followed by a support value ("Clade1 0.95").
static void parse_internal_label(RootedTreeNode & nd,
                                 const std::string & label,
                                 const ParsingRules & parsingRules) {
    if (!parsingRules.support_from_internal_labels) {
        nd.set_name(label);
        return;
    }
    double support;
    if (char_ptr_to_double(label.c_str(), &support)) {
        nd.set_support(support);
        return;
    }
    const auto sp = label.rfind(' ');
    if (sp != std::string::npos
        && char_ptr_to_double(label.c_str() + sp + 1, &support)) {
        nd.set_name(label.substr(0, sp));
        nd.set_support(support);
        return;
    }
    nd.set_name(label);
}

void newick_parse_node_info(RootedTree & tree,
                            NodeId node,
                            const NewickTokenizer::Token * labelToken,
                            const NewickTokenizer::Token * brLenToken,
                            const ParsingRules & parsingRules) {
    auto & nd = tree.get_node(node);
    if (labelToken) {
        if (nd.is_tip()) {
            nd.set_name(labelToken->content());
        } else {
            parse_internal_label(nd, labelToken->content(), parsingRules);
        }
    }
    if (brLenToken) {
        const auto & bl = brLenToken->content();
        double d;
        if (!char_ptr_to_double(bl.c_str(), &d)) {
            throw TWRParsingError("Expecting a number for the branch length.", bl, brLenToken->get_start_pos());
        }
        if (d < 0.0 && !parsingRules.allow_negative_branch_lengths) {
            throw TWRParsingError("Negative branch length.", bl, brLenToken->get_start_pos());
        }
        nd.set_branch_length(d);
    }
}

std::unique_ptr<RootedTree> read_next_newick(std::istream &inp,
                                             FilePosStruct & pos,
                                             const ParsingRules &parsingRules) {
    NewickTokenizer tokenizer(inp, pos);
    auto tokenIt = tokenizer.begin();
    if (tokenIt == tokenizer.end()) {
        pos.set_location_in_file(tokenIt.get_curr_pos());
        return std::unique_ptr<RootedTree>(nullptr);
    }
    std::stack<NodeId> nodeStack;
    std::unique_ptr<RootedTree> treePtr(new RootedTree());
    auto & tree = *treePtr;
    NodeId currNode = tree.create_root();
    // If we read a label or colon, we might consume multiple tokens;
    for (; tokenIt != tokenizer.end(); ) {
        const NewickTokenizer::Token topOfLoopToken = *tokenIt;
        if (topOfLoopToken.state == NewickTokenizer::NWK_OPEN) {
            nodeStack.push(currNode);
            currNode = tree.create_child(currNode);
            ++tokenIt;
        } else if (topOfLoopToken.state == NewickTokenizer::NWK_CLOSE) {
            assert(!nodeStack.empty()); // NewickTokenizer throws if unbalanced
            newick_close_node_hook(tree, currNode, topOfLoopToken, parsingRules);
            currNode = nodeStack.top();
            nodeStack.pop();
            ++tokenIt;
        } else if (topOfLoopToken.state == NewickTokenizer::NWK_COMMA) {
            assert(!nodeStack.empty());
            newick_close_node_hook(tree, currNode, topOfLoopToken, parsingRules);
            currNode = tree.create_sib(currNode);
            ++tokenIt;
        } else if (topOfLoopToken.state == NewickTokenizer::NWK_LABEL) {
            ++tokenIt;
            const NewickTokenizer::Token colonToken = *tokenIt;
            if (colonToken.state == NewickTokenizer::NWK_COLON) {
                ++tokenIt;
                const NewickTokenizer::Token brLenToken = *tokenIt;
                assert(brLenToken.state == NewickTokenizer::NWK_BRANCH_INFO);
                newick_parse_node_info(tree, currNode, &topOfLoopToken, &brLenToken, parsingRules);
                ++tokenIt;
            } else {
                newick_parse_node_info(tree, currNode, &topOfLoopToken, nullptr, parsingRules);
            }
        } else if (topOfLoopToken.state == NewickTokenizer::NWK_COLON) {
            ++tokenIt;
            const NewickTokenizer::Token brLenToken = *tokenIt;
            assert(brLenToken.state == NewickTokenizer::NWK_BRANCH_INFO);
            newick_parse_node_info(tree, currNode, nullptr, &brLenToken, parsingRules);
            ++tokenIt;
        } else {
            assert(topOfLoopToken.state == NewickTokenizer::NWK_SEMICOLON);
            assert(nodeStack.empty());
            newick_close_node_hook(tree, currNode, topOfLoopToken, parsingRules);
            pos.set_location_in_file(tokenIt.get_curr_pos());
            break;
        }
    }
    return treePtr;
}

std::unique_ptr<RootedTree> tree_from_newick_string(const std::string& s,
                                                    const ParsingRules & rules,
                                                    const FilePosStruct & startPos) {
    std::istringstream sfile(s);
    FilePosStruct pos(startPos);
    auto tree = read_next_newick(sfile, pos, rules);
    if (not tree) {
        throw TWRParsingError("Newick string is empty (no tokens)");
    }
    FilePosStruct trailing(pos);
    if (read_next_newick(sfile, trailing, rules) != nullptr) {
        throw TWRParsingError("More than one tree found in a single newick statement.", std::string(), pos);
    }
    return tree;
}

std::unique_ptr<RootedTree> tree_from_newick_string(const std::string& s, const ParsingRules & rules) {
    return tree_from_newick_string(s, rules, FilePosStruct());
}

std::unique_ptr<RootedTree> tree_from_newick_string(const std::string& s) {
    ParsingRules rules;
    return tree_from_newick_string(s, rules);
}

std::vector<std::string> split_newick_statements(const std::string & blob,
                                                 std::vector<FilePosStruct> * startPositions,
                                                 ConstStrPtr filepath) {
    std::vector<std::string> statements;
    std::string curr;
    FilePosStruct here(0, 0, 0, filepath);
    FilePosStruct currStart(here);
    bool inQuote = false;
    unsigned commentDepth = 0;
    auto emit = [&]() {
        auto stripped = strip_surrounding_whitespace(curr);
        if (!stripped.empty() && stripped != ";") {
            if (stripped.back() != ';') {
                stripped.push_back(';');
            }
            statements.push_back(stripped);
            if (startPositions != nullptr) {
                startPositions->push_back(currStart);
            }
        }
        curr.clear();
    };
    for (const auto & c : blob) {
        if (curr.empty() || find_first_graph_index(curr) == std::string::npos) {
            currStart = here;
        }
        curr += c;
        if (inQuote) {
            if (c == '\'') {
                // a doubled quote reopens immediately on the next character
                inQuote = false;
            }
        } else if (commentDepth > 0) {
            if (c == '[') {
                ++commentDepth;
            } else if (c == ']') {
                --commentDepth;
            }
        } else if (c == '\'') {
            inQuote = true;
        } else if (c == '[') {
            commentDepth = 1;
        } else if (c == ';') {
            emit();
        }
        if (c == '\n' && (inQuote || commentDepth > 0)) {
            // an unclosed quote or comment ends with its line
            inQuote = false;
            commentDepth = 0;
            const auto last = find_last_graph_index(curr);
            if (last != std::string::npos && curr[last] == ';') {
                emit();
            }
        }
        here.pos += 1;
        if (c == '\n') {
            here.lineNumber += 1;
            here.colNumber = 0;
        } else {
            here.colNumber += 1;
        }
    }
    emit();
    return statements;
}

bool process_trees(const std::string& filename,
                   const ParsingRules& parsingRules,
                   TreeCallback callback,
                   TreeStreamStats * stats) {
    const auto content = read_str_content_of_utf8_file(filename);
    ConstStrPtr filenamePtr = ConstStrPtr(new std::string(filename));
    std::vector<FilePosStruct> starts;
    const auto statements = split_newick_statements(content, &starts, filenamePtr);
    LOG(DEBUG) << statements.size() << " newick statement(s) in \"" << filename << "\"";
    std::size_t treeNum = 0;
    for (std::size_t i = 0; i < statements.size(); ++i) {
        const auto & statement = statements[i];
        if (stats != nullptr) {
            stats->attempted += 1;
        }
        std::unique_ptr<RootedTree> tree;
        try {
            tree = tree_from_newick_string(statement, parsingRules, starts[i]);
        } catch (const TWRParsingError & x) {
            LOG(WARNING) << "Skipping malformed tree in \"" << filename << "\": " << x.what();
            if (stats != nullptr) {
                stats->parse_failures += 1;
            }
            continue;
        }
        treeNum += 1;
        tree->set_name(std::string("tree ") + std::to_string(treeNum) + " from " + filepath_to_filename(filename));
        if (!callback(std::move(tree), statement)) {
            return false;
        }
    }
    return true;
}

} //namespace twr
