#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "twr/util.h"

namespace twr {

const std::string read_str_content_of_utf8_file(const std::string &filepath) {
    std::ifstream inp;
    inp.open(filepath);
    if (!inp.good()) {
        throw TWRError("Could not open \"" + filepath + "\"");
    }
    const std::string utf8content((std::istreambuf_iterator<char>(inp) ),
                                    (std::istreambuf_iterator<char>()));
    return utf8content;
}

bool open_utf8_file(const std::string &filepath, std::ifstream & inp) {
    inp.open(filepath);
    return inp.good();
}

std::list<std::string> read_lines_of_file(const std::string & filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw TWRError("Could not open file \"" + filepath + "\"");
    }
    std::list<std::string> lines;
    std::string line;
    while (getline(inp, line)) {
        auto stripped = strip_surrounding_whitespace(line);
        if (!stripped.empty()) {
            lines.push_back(stripped);
        }
    }
    return lines;
}

/*!
    Returns true if `o` points to a string that represents a real number (and `o` has
    no other characters than the number). If n is not NULL, then when the function
    returns true, *n will be the value.
*/
bool char_ptr_to_double(const char *o, double *n) {
    if (o == nullptr || *o == '\0') {
        return false;
    }
    if (strchr("0123456789-+.", *o) == nullptr) {
        return false;
    }
    char * pEnd;
    const double d = strtod(o, &pEnd);
    if (*pEnd != '\0') {
        return false;
    }
    if (n != nullptr) {
        *n = d;
    }
    return true;
}

std::list<std::string> split_string(const std::string &s, const char delimiter) {
    if (s.empty()) {
        return {};
    }
    std::list<std::string> r;
    r.push_back({});
    for (const auto & c : s) {
        if (c == delimiter) {
            r.push_back({});
        } else {
            r.back().append(1, c);
        }
    }
    return r;
}

std::vector<std::string> parse_delim_separated_names(const std::string &str, const char delimiter) {
    std::vector<std::string> names;
    for (const auto & word : split_string(str, delimiter)) {
        auto stripped = strip_surrounding_whitespace(word);
        if (!stripped.empty()) {
            names.push_back(stripped);
        }
    }
    return names;
}

std::string filepath_to_filename(const std::string &filepath) {
    auto p = filepath.find_last_of('/');
    if (p == std::string::npos) {
        return filepath;
    }
    return filepath.substr(1 + p);
}

}//namespace twr
