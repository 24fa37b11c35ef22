#include "twr/tree.h"

namespace twr {

NodeId RootedTree::alloc_new_node() {
    const NodeId nd = nodes.size();
    nodes.emplace_back(nd);
    return nd;
}

NodeId RootedTree::create_root() {
    if (root != NO_NODE) {
        nodes.clear();
    }
    root = alloc_new_node();
    return root;
}

NodeId RootedTree::create_child(NodeId par) {
    const auto c = alloc_new_node();
    add_child(par, c);
    return c;
}

NodeId RootedTree::create_sib(NodeId leftSib) {
    assert(nodes[leftSib].parent != NO_NODE);
    const auto s = alloc_new_node();
    add_sib_on_right(nodes[nodes[leftSib].parent].rChild, s);
    return s;
}

void RootedTree::set_root(NodeId nd) {
    assert(nodes[nd].parent == NO_NODE);
    root = nd;
}

void RootedTree::add_sib_on_right(NodeId nd, NodeId n) {
    auto & x = nodes[nd];
    auto & nn = nodes[n];
    assert(x.parent != NO_NODE);
    // Connect right (from n)
    nn.rSib = x.rSib;
    if (nn.rSib != NO_NODE) {
        nodes[nn.rSib].lSib = n;
    } else {
        assert(nodes[x.parent].rChild == nd);
        nodes[x.parent].rChild = n;
    }
    // Connect left (from n)
    nn.lSib = nd;
    x.rSib = n;
    // Connect up (from n)
    nn.parent = x.parent;
}

void RootedTree::add_child(NodeId par, NodeId c) {
    assert(nodes[c].parent == NO_NODE);
    auto & p = nodes[par];
    if (p.rChild != NO_NODE) {
        add_sib_on_right(p.rChild, c);
    } else {
        p.lChild = c;
        p.rChild = c;
        nodes[c].lSib = NO_NODE;
        nodes[c].rSib = NO_NODE;
        nodes[c].parent = par;
    }
}

void RootedTree::detach_this_node(NodeId nd) {
    auto & x = nodes[nd];
    assert(x.parent != NO_NODE);
    auto & p = nodes[x.parent];
    assert(p.has_children());
    if (x.lSib != NO_NODE) {
        nodes[x.lSib].rSib = x.rSib;
    } else {
        p.lChild = x.rSib;
    }
    if (x.rSib != NO_NODE) {
        nodes[x.rSib].lSib = x.lSib;
    } else {
        p.rChild = x.lSib;
    }
    x.parent = NO_NODE;
    x.rSib = NO_NODE;
    x.lSib = NO_NODE;
}

void RootedTree::replace_this_node(NodeId nd, NodeId n) {
    assert(n != nd);
    assert(nodes[n].parent == NO_NODE);
    auto & x = nodes[nd];
    auto & nn = nodes[n];
    assert(x.parent != NO_NODE);
    auto & p = nodes[x.parent];
    assert(p.has_children());
    nn.lSib = x.lSib;
    if (x.lSib != NO_NODE) {
        nodes[x.lSib].rSib = n;
    } else {
        p.lChild = n;
    }
    nn.rSib = x.rSib;
    if (x.rSib != NO_NODE) {
        nodes[x.rSib].lSib = n;
    } else {
        p.rChild = n;
    }
    nn.parent = x.parent;
    x.parent = NO_NODE;
    x.lSib = NO_NODE;
    x.rSib = NO_NODE;
}

std::optional<NodeId> RootedTree::get_parent(NodeId nd) const {
    const auto p = get_node(nd).parent;
    if (p == NO_NODE) {
        return std::nullopt;
    }
    return p;
}

std::vector<NodeId> RootedTree::get_children(NodeId nd) const {
    std::vector<NodeId> r;
    for (auto c = get_node(nd).lChild; c != NO_NODE; c = nodes[c].rSib) {
        r.push_back(c);
    }
    return r;
}

std::vector<NodeId> RootedTree::get_siblings(NodeId nd) const {
    std::vector<NodeId> r;
    const auto p = get_node(nd).parent;
    if (p == NO_NODE) {
        return r;
    }
    for (auto c = nodes[p].lChild; c != NO_NODE; c = nodes[c].rSib) {
        if (c != nd) {
            r.push_back(c);
        }
    }
    return r;
}

bool RootedTree::is_attached(NodeId nd) const {
    if (root == NO_NODE || nd >= nodes.size()) {
        return false;
    }
    while (nodes[nd].parent != NO_NODE) {
        nd = nodes[nd].parent;
    }
    return nd == root;
}

// preorder, so callers see ancestors before descendants
std::vector<NodeId> RootedTree::get_subtree_nodes(NodeId p) const {
    std::vector<NodeId> r;
    if (p == NO_NODE) {
        return r;
    }
    std::vector<NodeId> stack;
    stack.push_back(p);
    while (!stack.empty()) {
        const auto nd = stack.back();
        stack.pop_back();
        r.push_back(nd);
        for (auto c = nodes[nd].rChild; c != NO_NODE; c = nodes[c].lSib) {
            stack.push_back(c);
        }
    }
    return r;
}

std::vector<NodeId> RootedTree::find_by_name(const std::string & n) const {
    std::vector<NodeId> r;
    for (auto nd : get_all_attached_nodes()) {
        if (nodes[nd].name == n) {
            r.push_back(nd);
        }
    }
    return r;
}

} // namespace twr
