#ifndef TREEWRANGLER_CONFIG_H
#define TREEWRANGLER_CONFIG_H

#include <string>
#include <vector>
#include <optional>
#include <boost/property_tree/ptree.hpp>
#include "twr/twr_base_includes.h"

namespace twr {
std::optional<std::string> load_config(const std::string& filename, const std::string& section, const std::string& name);
std::optional<std::string> load_config(const std::vector<std::string>& filenames, const std::string& section, const std::string& name);
std::optional<std::string> dot_treewrangler();
std::optional<std::string> interpolate(const boost::property_tree::ptree& pt, const std::string& section_name, const std::string& key);
// comma-separated value of `name`, stripped, empty entries dropped
std::optional<NameSet> load_name_set_config(const std::vector<std::string>& filenames, const std::string& section, const std::string& name);
std::optional<double> load_double_config(const std::vector<std::string>& filenames, const std::string& section, const std::string& name);
}
#endif
