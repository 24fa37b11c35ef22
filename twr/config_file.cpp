#include "twr/config_file.h"
#include <cstdlib>
#include <regex>
#include <fstream>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/filesystem/operations.hpp>
#include "twr/error.h"
#include "twr/util.h"

namespace fs = boost::filesystem;

using std::string;
using std::size_t;
using std::vector;
using std::optional;
using boost::property_tree::ptree;

namespace twr {

// Expands %(key)s references to other keys of the same section (themselves
//  expanded, up to 20 levels deep); %% is a literal percent sign.
static string expand_value(const ptree& section, const string& key, const string& value, int depth) {
    static const std::regex KEYCRE ("%\\(([^)]+)\\)s");
    if (depth > 20) {
        throw TWRError() << "Interpolation of " << key << " is nested too deeply";
    }
    string value2;
    size_t p1 = 0U;
    while (p1 < value.size()) {
        size_t p2 = value.find('%', p1);
        if (p2 == string::npos) {
            p2 = value.size();
        }
        value2 += value.substr(p1, p2 - p1);
        if (p2 == value.size()) {
            break;
        }
        if (p2 + 1 >= value.size()) {
            throw TWRError() << "Found '%' at end of string!";
        }
        char c = value[p2 + 1];
        if (c == '%') {
            value2 += "%";
            p1 = p2 + 2;
        } else if (c == '(') {
            std::cmatch m;
            bool matched = std::regex_search(value.c_str() + p2, value.c_str() + value.size(), m, KEYCRE,
                                             std::regex_constants::match_continuous);
            if (not matched) {
                throw TWRError() << "Bad interpolation variable reference: '" << value.substr(p2) << "'";
            }
            string name = m[1];
            if (not section.get_optional<string>(name)) {
                throw TWRError() << "Reference to undefined key '" << name << "' in " << key << " = " << value;
            }
            value2 += expand_value(section, name, section.get<string>(name), depth + 1);
            p1 = p2 + m.length(0);
        } else {
            throw TWRError() << "Bad interpolation variable reference: '" << value.substr(p2) << "'";
        }
    }
    return value2;
}

optional<string> interpolate(const ptree& pt, const string& section_name, const string& key) {
    if (not pt.get_child_optional(section_name)) {
        return std::nullopt;
    }
    const ptree& section = pt.get_child(section_name);
    if (not section.get_optional<string>(key)) {
        return std::nullopt;
    }
    return expand_value(section, key, section.get<string>(key), 0);
}

optional<string> load_config(const string& filename, const string& section, const string& name) {
    ptree pt;
    try {
        boost::property_tree::ini_parser::read_ini(filename, pt);
    } catch (const boost::property_tree::ini_parser_error & x) {
        throw TWRError() << "Could not read config file: " << x.what();
    }
    return interpolate(pt, section, name);
}

optional<string> load_config(const vector<string>& filenames, const string& section, const string& name) {
    for (const auto& filename: filenames) {
        auto result = load_config(filename, section, name);
        if (result) {
            return result;
        }
    }
    return std::nullopt;
}

optional<string> dot_treewrangler() {
    auto homedir = std::getenv("HOME");
    if (not homedir) {
        return std::nullopt;
    }
    fs::path path(homedir);
    path /= ".treewrangler";
    if (not fs::is_regular_file(path)) {
        return std::nullopt;
    }
    return path.string();
}

optional<NameSet> load_name_set_config(const vector<string>& filenames, const string& section, const string& name) {
    auto value = load_config(filenames, section, name);
    if (not value) {
        return std::nullopt;
    }
    const auto names = parse_delim_separated_names(*value, ',');
    return NameSet(names.begin(), names.end());
}

optional<double> load_double_config(const vector<string>& filenames, const string& section, const string& name) {
    auto value = load_config(filenames, section, name);
    if (not value) {
        return std::nullopt;
    }
    double d;
    const auto stripped = strip_surrounding_whitespace(*value);
    if (not char_ptr_to_double(stripped.c_str(), &d)) {
        throw TWRError() << "Expecting a number for [" << section << "] " << name << " but found \"" << *value << "\"";
    }
    return d;
}

}
