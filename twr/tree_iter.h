#ifndef TREEWRANGLER_TREE_ITER_H
#define TREEWRANGLER_TREE_ITER_H
// Iterators for traversing trees
// Depends on: tree.h
// Depended on by: tree_operations.h newick_writer.h

#include <iterator>
#include <stdexcept>
#include "twr/twr_base_includes.h"
#include "twr/tree.h"

namespace twr {

/// visits ancestors before descendants
/// if filter_fn is supplied, then only the nodes associated with a true
///     response will be returned (but the descendants of a "false" node
///     will still be visited.
class preorder_iterator {
    private:
        const RootedTree * tree;
        NodePred filter_fn;
        NodeId curr;
        NodeId subtree_root;
        void _unfiltered_advance() {
            const auto & nd = tree->get_node(curr);
            if (nd.is_internal()) {
                curr = nd.get_first_child();
                return;
            }
            while (curr != subtree_root) {
                const auto & c = tree->get_node(curr);
                if (c.get_next_sib() != NO_NODE) {
                    curr = c.get_next_sib();
                    return;
                }
                curr = c.get_parent();
                assert(curr != NO_NODE);
            }
            curr = NO_NODE;
        }
        void _advance() {
            do {
                _unfiltered_advance();
            } while (curr != NO_NODE && filter_fn != nullptr && !filter_fn(tree->get_node(curr)));
        }
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = NodeId;
        using difference_type = std::ptrdiff_t;
        using pointer = const NodeId *;
        using reference = NodeId;

        preorder_iterator(const RootedTree * t, NodeId c, NodePred f = nullptr)
            :tree(t),
            filter_fn(f),
            curr(c),
            subtree_root(c) {
            if (curr != NO_NODE && filter_fn && !filter_fn(tree->get_node(curr))) {
                _advance();
            }
        }
        bool operator==(const preorder_iterator &other) const {
            return this->curr == other.curr;
        }
        bool operator!=(const preorder_iterator &other) const {
            return this->curr != other.curr;
        }
        NodeId operator*() const {
            return curr;
        }
        preorder_iterator & operator++() {
            if (curr == NO_NODE) {
                throw std::out_of_range("Incremented a dead preorder_iterator");
            }
            _advance();
            return *this;
        }
};

/// descendants before ancestors; children in insertion order.
class postorder_iterator {
    private:
        const RootedTree * tree;
        NodeId curr;
        NodeId subtree_root;
        NodeId leftmost_tip(NodeId nd) const {
            auto next = tree->get_node(nd).get_first_child();
            while (next != NO_NODE) {
                nd = next;
                next = tree->get_node(nd).get_first_child();
            }
            return nd;
        }
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = NodeId;
        using difference_type = std::ptrdiff_t;
        using pointer = const NodeId *;
        using reference = NodeId;

        postorder_iterator(const RootedTree * t, NodeId c)
            :tree(t),
            curr(NO_NODE),
            subtree_root(c) {
            if (c != NO_NODE) {
                curr = leftmost_tip(c);
            }
        }
        bool operator==(const postorder_iterator &other) const {
            return this->curr == other.curr;
        }
        bool operator!=(const postorder_iterator &other) const {
            return this->curr != other.curr;
        }
        NodeId operator*() const {
            return curr;
        }
        postorder_iterator & operator++() {
            if (curr == NO_NODE) {
                throw std::out_of_range("Incremented a dead postorder_iterator");
            }
            if (curr == subtree_root) {
                curr = NO_NODE;
                return *this;
            }
            const auto & nd = tree->get_node(curr);
            if (nd.get_next_sib() != NO_NODE) {
                curr = leftmost_tip(nd.get_next_sib());
            } else {
                curr = nd.get_parent();
            }
            return *this;
        }
};

class child_iterator {
    private:
        const RootedTree * tree;
        NodeId curr;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = NodeId;
        using difference_type = std::ptrdiff_t;
        using pointer = const NodeId *;
        using reference = NodeId;

        child_iterator(const RootedTree * t, NodeId c)
            :tree(t),
            curr(c) {
        }
        bool operator==(const child_iterator &other) const {
            return this->curr == other.curr;
        }
        bool operator!=(const child_iterator &other) const {
            return this->curr != other.curr;
        }
        NodeId operator*() const {
            return curr;
        }
        child_iterator & operator++() {
            if (curr == NO_NODE) {
                throw std::out_of_range("Incremented a dead child_iterator");
            }
            curr = tree->get_node(curr).get_next_sib();
            return *this;
        }
};

// Each call to begin() starts a fresh traversal, so a range can be iterated
//  more than once. The tree must not be restructured during a traversal.
template<typename T>
class tree_range {
    public:
        tree_range(T b, T e)
            :b_it(b),
            e_it(e) {
        }
        T begin() const {
            return b_it;
        }
        T end() const {
            return e_it;
        }
    private:
        const T b_it;
        const T e_it;
};

inline bool is_leaf_pred(const RootedTreeNode & nd) {
    return nd.is_tip();
}

inline bool is_internal_pred(const RootedTreeNode & nd) {
    return nd.is_internal();
}

inline tree_range<preorder_iterator> iter_pre_n(const RootedTree & tree, NodeId nd) {
    return tree_range<preorder_iterator>(preorder_iterator(&tree, nd), preorder_iterator(&tree, NO_NODE));
}

inline tree_range<preorder_iterator> iter_pre(const RootedTree & tree) {
    return iter_pre_n(tree, tree.get_root());
}

inline tree_range<postorder_iterator> iter_post_n(const RootedTree & tree, NodeId nd) {
    return tree_range<postorder_iterator>(postorder_iterator(&tree, nd), postorder_iterator(&tree, NO_NODE));
}

inline tree_range<postorder_iterator> iter_post(const RootedTree & tree) {
    return iter_post_n(tree, tree.get_root());
}

inline tree_range<preorder_iterator> iter_leaf_n(const RootedTree & tree, NodeId nd) {
    return tree_range<preorder_iterator>(preorder_iterator(&tree, nd, is_leaf_pred),
                                         preorder_iterator(&tree, NO_NODE));
}

inline tree_range<preorder_iterator> iter_leaf(const RootedTree & tree) {
    return iter_leaf_n(tree, tree.get_root());
}

inline tree_range<preorder_iterator> iter_internal(const RootedTree & tree) {
    return tree_range<preorder_iterator>(preorder_iterator(&tree, tree.get_root(), is_internal_pred),
                                         preorder_iterator(&tree, NO_NODE));
}

inline tree_range<child_iterator> iter_child(const RootedTree & tree, NodeId nd) {
    return tree_range<child_iterator>(child_iterator(&tree, tree.get_node(nd).get_first_child()),
                                      child_iterator(&tree, NO_NODE));
}

} // namespace twr
#endif
