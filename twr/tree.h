#ifndef TREEWRANGLER_TREE_H
#define TREEWRANGLER_TREE_H

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "twr/twr_base_includes.h"

namespace twr {

typedef std::string namestring_t;

// A node is a record in the arena of its RootedTree. Links to relatives are
//  arena indices (NO_NODE when absent); the parent link is a back-reference only.
class RootedTreeNode {
    public:
        bool is_tip() const { return (lChild == NO_NODE); }

        bool is_internal() const { return not is_tip(); }

        NodeId get_id() const { return id; }

        NodeId get_parent() const { return parent; }

        NodeId get_first_child() const { return lChild; }

        NodeId get_last_child() const { return rChild; }

        NodeId get_prev_sib() const { return lSib; }

        NodeId get_next_sib() const { return rSib; }

        bool has_children() const {
            assert((lChild == NO_NODE) == (rChild == NO_NODE));
            return lChild != NO_NODE;
        }
        const namestring_t & get_name() const {
            return name;
        }
        bool has_name() const {
            return not name.empty();
        }
        void set_name(const namestring_t &n) {
            name = n;
        }
        void set_name(namestring_t && n) {
            name = std::move(n);
        }
        bool has_support() const {
            return support.has_value();
        }
        double get_support() const {
            assert(has_support());
            return *support;
        }
        void set_support(double s) {
            support = s;
        }
        bool has_branch_length() const {
            return branch_length.has_value();
        }
        double get_branch_length() const {
            assert(has_branch_length());
            return *branch_length;
        }
        const std::optional<double> & get_optional_branch_length() const {
            return branch_length;
        }
        void set_branch_length(double b) {
            branch_length = b;
        }
        void set_branch_length(const std::optional<double> & b) {
            branch_length = b;
        }
        void del_branch_length() {
            branch_length.reset();
        }
        explicit RootedTreeNode(NodeId nodeId)
            :id(nodeId) {
        }
    private:
        NodeId id;
        NodeId lChild = NO_NODE;
        NodeId rChild = NO_NODE;
        NodeId lSib = NO_NODE;
        NodeId rSib = NO_NODE;
        NodeId parent = NO_NODE;
        namestring_t name;     // taxon identifier for leaves, optional for internals
        std::optional<double> support;
        std::optional<double> branch_length; // distance to the parent
        friend class RootedTree;
};

// Rooted, ordered tree. The tree owns every node it ever allocated; nodes that
//  are detached stay in the arena but are no longer reachable from the root.
class RootedTree {
    public:
        using node_type = RootedTreeNode;

        RootedTree() = default;
        RootedTree(RootedTree &&) = default;
        RootedTree & operator=(RootedTree &&) = default;

        const node_type & get_node(NodeId nd) const {
            assert(nd < nodes.size());
            return nodes[nd];
        }
        node_type & get_node(NodeId nd) {
            assert(nd < nodes.size());
            return nodes[nd];
        }
        const node_type & operator[](NodeId nd) const {
            return get_node(nd);
        }
        node_type & operator[](NodeId nd) {
            return get_node(nd);
        }
        NodeId get_root() const {
            return root;
        }
        bool empty() const {
            return root == NO_NODE;
        }
        // number of nodes ever allocated (attached or not)
        std::size_t get_num_allocated_nodes() const {
            return nodes.size();
        }
        void set_name(const std::string &n) {
            name.assign(n);
        }
        const std::string & get_name() const {
            return name;
        }

        NodeId create_root();
        NodeId create_child(NodeId par);
        NodeId create_sib(NodeId leftSib);
        // makes a node with no parent the new root. The old root (if any)
        //  becomes unreachable.
        void set_root(NodeId nd);

        void add_child(NodeId par, NodeId c);
        void add_sib_on_right(NodeId nd, NodeId n);
        // takes nd out of the child list of its parent.
        void detach_this_node(NodeId nd);
        // places `n` into the parent's child list in the place of `nd`,
        //  which is left without parent or siblings.
        void replace_this_node(NodeId nd, NodeId n);

        std::optional<NodeId> get_parent(NodeId nd) const;
        std::vector<NodeId> get_children(NodeId nd) const;
        // children of the parent of nd, other than nd (empty for the root)
        std::vector<NodeId> get_siblings(NodeId nd) const;
        // every attached node labelled `n` in preorder
        std::vector<NodeId> find_by_name(const std::string & n) const;
        bool is_attached(NodeId nd) const;
        std::vector<NodeId> get_subtree_nodes(NodeId p) const;
        std::vector<NodeId> get_all_attached_nodes() const {
            return get_subtree_nodes(root);
        }
    private:
        NodeId alloc_new_node();

        std::vector<node_type> nodes;
        NodeId root = NO_NODE;
        std::string name;

        RootedTree(const RootedTree &) = delete;
        RootedTree & operator=(const RootedTree &) = delete;
};

} // namespace twr
#endif
