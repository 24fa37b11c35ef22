#ifndef TREEWRANGLER_UTIL_H
#define TREEWRANGLER_UTIL_H

#include <iostream>
#include <fstream>
#include <string>
#include <cctype>
#include <cstring>
#include <map>
#include <set>
#include <vector>
#include <algorithm>
#include <iterator>
#include <list>
#include "twr/twr_base_includes.h"
#include "twr/error.h"

namespace twr {

enum QuotingRequirementsEnum {
    NO_QUOTES_NEEDED,
    QUOTES_NEEDED
};

const std::string read_str_content_of_utf8_file(const std::string &filepath);
bool open_utf8_file(const std::string &filepath, std::ifstream & inp);
std::list<std::string> read_lines_of_file(const std::string & filepath);
std::string filepath_to_filename(const std::string &filepath);

bool char_ptr_to_double(const char *c, double *n);
std::size_t find_first_graph_index(const std::string & s);
std::size_t find_last_graph_index(const std::string & s);
std::string strip_surrounding_whitespace(const std::string &n);
// consecutive delimiters lead to an empty string
std::list<std::string> split_string(const std::string &s, const char delimiter);
// Splits on the delimiter, strips each field and drops empty fields. Order is kept.
std::vector<std::string> parse_delim_separated_names(const std::string &str, const char delimiter);

QuotingRequirementsEnum determine_newick_quoting_requirements(const std::string & s);
std::string add_newick_quotes(const std::string &s);
void write_escaped_for_newick(std::ostream & out, const std::string & n);

template<typename T, typename U>
bool contains(const T & container, const U & key);
template<typename T>
std::set<T> set_intersection_as_set(const std::set<T> & small, const std::set<T> & big);
template <typename T>
std::ostream& write_separated_collection(std::ostream& o, const T& s, const char * sep);

template<typename T, typename U>
inline bool contains(const T & container, const U & key) {
    return container.find(key) != container.end();
}

template<typename T>
inline std::set<T> set_intersection_as_set(const std::set<T> & small, const std::set<T> & big) {
    std::set<T> intersection;
    std::set_intersection(small.begin(), small.end(),
                          big.begin(), big.end(),
                          std::inserter(intersection, intersection.begin()));
    return intersection;
}

template <typename T>
inline std::ostream& write_separated_collection(std::ostream& o, const T& s, const char * sep) {
    bool first = true;
    for (const auto & el : s) {
        if (not first) {
            o << sep;
        }
        o << el;
        first = false;
    }
    return o;
}

inline std::size_t find_first_graph_index(const std::string & s) {
    std::size_t pos = 0;
    for (const auto & c : s) {
        if (std::isgraph(static_cast<unsigned char>(c))) {
            return pos;
        }
        ++pos;
    }
    return std::string::npos;
}

inline std::size_t find_last_graph_index(const std::string & s) {
    auto pos = s.length();
    while (pos > 0) {
        --pos;
        if (std::isgraph(static_cast<unsigned char>(s[pos]))) {
            return pos;
        }
    }
    return std::string::npos;
}

inline std::string strip_surrounding_whitespace(const std::string &n) {
    const auto s = find_first_graph_index(n);
    if (s == std::string::npos) {
        return std::string();
    }
    const auto e = find_last_graph_index(n);
    assert(e != std::string::npos);
    return n.substr(s, 1 + e - s);
}

// Underscores are kept verbatim by the tokenizer, so (unlike the classic
//  Newick rules) they do not force quoting.
inline QuotingRequirementsEnum determine_newick_quoting_requirements(const std::string & s) {
    QuotingRequirementsEnum nrq = NO_QUOTES_NEEDED;
    for (const auto & c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x80) {
            continue; // UTF-8
        }
        if (!std::isgraph(u)) {
            if (c != ' ') {
                return QUOTES_NEEDED;
            }
            nrq  = QUOTES_NEEDED;
        } else if (strchr("(),;:[]'", c) != nullptr) {
            return QUOTES_NEEDED;
        }
    }
    return nrq;
}

inline std::string add_newick_quotes(const std::string &s) {
    std::string withQuotes;
    unsigned len = static_cast<unsigned>(s.length());
    withQuotes.reserve(len + 4);
    withQuotes.append(1,'\'');
    for (const auto & c : s) {
        withQuotes.append(1, c);
        if (c == '\'') {
            withQuotes.append(1,'\'');
        }
    }
    withQuotes.append(1,'\'');
    return withQuotes;
}

inline void write_escaped_for_newick(std::ostream & out, const std::string & n) {
    const QuotingRequirementsEnum r = determine_newick_quoting_requirements(n);
    if (r == NO_QUOTES_NEEDED) {
        out << n;
    } else {
        out << add_newick_quotes(n);
    }
}

} // namespace twr
#endif
