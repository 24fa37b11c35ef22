#ifndef TREEWRANGLER_GROUP_MAP_H
#define TREEWRANGLER_GROUP_MAP_H
// Reading of leaf -> group mappings.
// Depended on by: tools/filter-groups.cpp
#include <iostream>
#include <string>
#include "twr/twr_base_includes.h"

namespace twr {

// Two comma-separated columns per line (leaf id, group), no header. Fields
//  may be double-quoted. Blank lines are skipped; columns after the second
//  are ignored. Throws TWRError (with the line number) for a line with fewer
//  than two fields or an empty field.
GroupMap read_group_map(std::istream & inp, const std::string & sourceName);
GroupMap read_group_map_file(const std::string & filepath);

std::size_t count_distinct_groups(const GroupMap & groups);

} // namespace twr
#endif
