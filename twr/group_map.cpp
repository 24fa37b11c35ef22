#include "twr/group_map.h"
#include <fstream>
#include <vector>
#include <boost/tokenizer.hpp>
#include "twr/error.h"
#include "twr/util.h"

namespace twr {

GroupMap read_group_map(std::istream & inp, const std::string & sourceName) {
    typedef boost::tokenizer<boost::escaped_list_separator<char> > csv_tokenizer;
    GroupMap groups;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(inp, line)) {
        lineNumber += 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (strip_surrounding_whitespace(line).empty()) {
            continue;
        }
        std::vector<std::string> fields;
        try {
            csv_tokenizer tok(line, boost::escaped_list_separator<char>('\\', ',', '\"'));
            for (const auto & f : tok) {
                fields.push_back(strip_surrounding_whitespace(f));
            }
        } catch (const boost::escaped_list_error & x) {
            throw TWRError() << "Malformed CSV at line " << lineNumber << " of \"" << sourceName << "\": " << x.what();
        }
        if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
            throw TWRError() << "Expecting \"id,group\" at line " << lineNumber << " of \"" << sourceName << "\"";
        }
        groups[fields[0]].insert(fields[1]);
    }
    LOG(DEBUG) << groups.size() << " leaves in " << count_distinct_groups(groups) << " groups read from \"" << sourceName << "\"";
    return groups;
}

GroupMap read_group_map_file(const std::string & filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw TWRError() << "Could not open group mapping file \"" << filepath << "\"";
    }
    return read_group_map(inp, filepath);
}

std::size_t count_distinct_groups(const GroupMap & groups) {
    std::set<std::string> all;
    for (const auto & leafGroups : groups) {
        all.insert(leafGroups.second.begin(), leafGroups.second.end());
    }
    return all.size();
}

} // namespace twr
