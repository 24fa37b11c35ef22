#if !defined TREEWRANGLER_BASE_INCLUDES_H
#define TREEWRANGLER_BASE_INCLUDES_H
#include "twr/assert.hh"
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#ifdef __clang__
#pragma clang diagnostic ignored "-Wpadded"
#pragma clang diagnostic ignored  "-Wweak-vtables"
#endif
// ELPP_THREAD_SAFE, ELPP_NO_DEFAULT_LOG_FILE and ELPP_CUSTOM_COUT are set by
//  the build so that easylogging++.cc is compiled with the same settings.
#include <easylogging++.h>

#define TWR_UNREACHABLE {LOG(ERROR)<<"Unreachable code reached!"; std::abort();}

namespace twr {
extern bool debugging_output_enabled;

// Index of a node in the arena of its RootedTree.
using NodeId = std::size_t;
constexpr NodeId NO_NODE = std::numeric_limits<NodeId>::max();

using NameSet = std::set<std::string>;
// leaf name -> group labels (e.g. species -> order). A leaf listed under
//  several groups counts toward each of them.
using GroupMap = std::map<std::string, std::set<std::string> >;

// forward decl
class RootedTreeNode;
class RootedTree;
struct ParsingRules;
struct NewickWriteOptions;

using NodePred = std::function<bool(const RootedTreeNode &)>;

} // namespace twr
#endif
