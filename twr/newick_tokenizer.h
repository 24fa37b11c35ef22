#ifndef TREEWRANGLER_NEWICK_TOKENIZER_H
#define TREEWRANGLER_NEWICK_TOKENIZER_H
#include <iostream>
#include <fstream>
#include <memory>
#include <stack>
#include <stdexcept>
#include <string>
#include <vector>
#include "twr/twr_base_includes.h"
#include "twr/error.h"
#include "twr/util.h"

namespace twr {

struct ParsingRules {
    bool require_leaf_names = true;          // every tip must carry a (non-empty) name
    bool support_from_internal_labels = true; // numeric label after ")" is a support value
    bool allow_negative_branch_lengths = false;
};

typedef std::shared_ptr<const std::string> ConstStrPtr;
struct FilePosStruct {
    FilePosStruct() = default;
    FilePosStruct(const FilePosStruct&) = default;
    FilePosStruct & operator=(const FilePosStruct&) = default;
    FilePosStruct(const ConstStrPtr fp):filepath(fp) {}
    FilePosStruct(std::size_t position, std::size_t line, std::size_t column, const ConstStrPtr& fp)
        :pos(position),
        lineNumber(line),
        colNumber(column),
        filepath(fp) {
    }

    void set_location_in_file(const FilePosStruct & other) {
        pos = other.pos;
        lineNumber = other.lineNumber;
        colNumber = other.colNumber;
    }
    std::string describe() const {
        std::string message;
        message = "At line ";
        message += std::to_string(1 + this->lineNumber);
        message += ", column ";
        message += std::to_string(1 + this->colNumber);
        message += ", filepos ";
        message += std::to_string(1 + this->pos);
        if (filepath) {
            message += " of \"";
            message += *filepath;
            message += "\"";
        } else {
            message += " of <UNKNOWN FILENAME>";
        }
        return message;
    }

    std::size_t pos = 0;
    std::size_t lineNumber = 0;
    std::size_t colNumber = 0;
    ConstStrPtr filepath = nullptr;
};

// Malformed Newick text: unbalanced parentheses, illegal token order,
//  unparseable numeric fields.
class TWRParsingError: public TWRError {
    public:
        TWRParsingError(const char * msg)
            :frag(msg) {
            (*this) << "parsing newick: " << msg;
        }
        TWRParsingError(const char * msg, char offending, const FilePosStruct & position)
            :TWRError(msg),
            frag(msg),
            pos(position) {
                if (offending != '\0') {
                    offendingStr.assign(1, offending);
                }
                message = this->generate_message();
            }
        TWRParsingError(const char * msg, const std::string & offending, const FilePosStruct & position)
            :TWRError(msg),
            frag(msg),
            offendingStr(offending),
            pos(position) {
                message = this->generate_message();
            }
        std::string generate_message() const {
            std::string m = "Error found \"";
            m += this->offendingStr;
            m += "\" ";
            m += this->frag;
            m += " ";
            m += this->pos.describe();
            return m;
        }
    private:
        const std::string frag;
        std::string offendingStr;
        const FilePosStruct pos;
};

// Syntactically valid Newick whose content breaks a tree invariant
//  (e.g. a leaf without a name).
class TWRParsingContentError: public TWRParsingError {
    public:
        TWRParsingContentError(const char * msg, const FilePosStruct & position)
            :TWRParsingError(msg, std::string(), position) {
            message = "Error found: ";
            message += msg;
            message += " ";
            message += position.describe();
        }
};

class NewickTokenizer {
    public:
        enum newick_token_state_t {
                NWK_NOT_IN_TREE, // before first token
                NWK_OPEN, // token was open-parens
                NWK_CLOSE, // token was close-parens
                NWK_COMMA, // token was ,
                NWK_COLON, // token was :
                NWK_BRANCH_INFO, // token was text after :
                NWK_LABEL, // token was text (but not after a :)
                NWK_SEMICOLON
            };
        NewickTokenizer(std::istream &inp, const FilePosStruct & initialPos)
            :input_stream(inp),
            initPos(initialPos) {
        }
        class iterator;
        // one token of the newick text. [comments] are skipped, not tokens.
        class Token {
            public:
                const std::string & content() const {
                    return this->text;
                }
                const FilePosStruct & get_start_pos() const {
                    return this->start_pos;
                }
                const std::string text;
                const FilePosStruct start_pos;
                const newick_token_state_t state;
            private:
                Token(const std::string & content, const FilePosStruct & startPosition, newick_token_state_t tokenState)
                    :text(content),
                    start_pos(startPosition),
                    state(tokenState) {
                }
                friend class NewickTokenizer::iterator;
        };

        // Reads one tree: the iterator is exhausted after the ; token.
        class iterator {
            public:
                bool operator==(const iterator & other) const {
                    return this->at_end && other.at_end;
                }
                bool operator!=(const iterator & other) const {
                    return !(*this == other);
                }
                Token operator*() const {
                    return Token(current_word, token_start_pos, current_token_state);
                }
                iterator & operator++() {
                    if (this->at_end) {
                        throw std::out_of_range("Incremented a dead NewickTokenizer::iterator");
                    }
                    this->reset_token();
                    if (this->previous_token_state == NWK_SEMICOLON) {
                        this->at_end = true;
                    } else {
                        this->consume_next_token();
                    }
                    return *this;
                }
                const FilePosStruct & get_curr_pos() const {
                    return this->current_pos;
                }
            private:
                void consume_next_token();
                bool advance_to_next_non_whitespace(char &);
                void finish_reading_comment();
                void finish_reading_unquoted();
                void finish_reading_quoted_str();
                void on_label_exit();
                void start_token(newick_token_state_t state, char c) {
                    this->token_start_pos = this->current_pos;
                    this->current_token_state = state;
                    this->current_word.assign(1, c);
                }
                [[noreturn]] void throw_scc_err(char c) const;
                void push(char c) {
                    this->pushed.push(c);
                    if (c == '\n') {
                        this->current_pos.colNumber = last_line_ind;
                        this->current_pos.lineNumber -= 1;
                    } else {
                        this->current_pos.colNumber -= 1;
                    }
                    this->current_pos.pos -= 1;
                }
                //deals with \r\n as \n Hence "LogicalChar"
                bool advance_reader_one_logical_char(char & c) {
                    if (!pushed.empty()) {
                        c = pushed.top();
                        pushed.pop();
                    } else {
                        const auto ic = (this->input_stream.rdbuf())->sbumpc();
                        if (ic == std::char_traits<char>::eof()) {
                            c = '\0';
                            return false;
                        }
                        c = std::char_traits<char>::to_char_type(ic);
                    }
                    this->current_pos.pos += 1;
                    if (13 == c || 10 == c) {
                        if (13 == c ) { // deal with \r\n as a newline
                            if (this->input_stream.rdbuf()->sgetc() == 10) {//peeks at the next char
                                (input_stream.rdbuf())->sbumpc();
                                this->current_pos.pos += 1;
                            }
                        }
                        c = '\n';
                        this->last_line_ind = this->current_pos.colNumber;
                        this->current_pos.colNumber = 0;
                        this->current_pos.lineNumber += 1;
                    } else {
                        this->current_pos.colNumber += 1;
                    }
                    return true;
                }
                void reset_token() {
                    this->current_word.clear();
                    this->previous_token_state = this->current_token_state;
                }
                iterator(std::istream &inp, const FilePosStruct & initialPos)
                    :input_stream(inp),
                    at_end(!inp.good()),
                    current_pos(initialPos),
                    token_start_pos(initialPos),
                    current_token_state(NWK_NOT_IN_TREE),
                    previous_token_state(NWK_NOT_IN_TREE) {
                    if (!at_end) {
                        this->consume_next_token();
                    }
                }
                iterator(std::istream &inp) // end() only
                    :input_stream(inp),
                    at_end(true),
                    current_token_state(NWK_NOT_IN_TREE),
                    previous_token_state(NWK_NOT_IN_TREE) {
                }
                std::istream & input_stream;
                bool at_end;
                FilePosStruct current_pos;
                FilePosStruct token_start_pos;
                std::string current_word;
                newick_token_state_t current_token_state;
                newick_token_state_t previous_token_state;
                long num_unclosed_parens = 0;
                std::stack<char> pushed;
                std::size_t last_line_ind = 0;
                friend class NewickTokenizer;
        };
        iterator begin() {
            iterator b(this->input_stream, initPos);
            return b;
        }
        iterator end() {
            return iterator(this->input_stream);
        }
    private:
        std::istream & input_stream;
        FilePosStruct initPos;
};

}// namespace twr
#endif
