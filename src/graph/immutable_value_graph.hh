// valgraph -- immutable value graph adaptors
//
// Copyright (C) 2026 The valgraph developers
//
// This program is free software; you can redistribute it and/or
// modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation; either version 3
// of the License, or (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <http://www.gnu.org/licenses/>.

#ifndef IMMUTABLE_VALUE_GRAPH_HH
#define IMMUTABLE_VALUE_GRAPH_HH

#include <memory>
#include <vector>

#include "value_graph.hh"

namespace valgraph
{

// ========================================================================
// immutable_value_graph<Node, Value>
// ========================================================================
//
// A frozen value_graph. The storage is shared between copies of the same
// immutable_value_graph, which are therefore cheap, and is never modified
// after construction. Iterators and ranges stay valid as long as any copy is
// alive.
//
// The only way of building one is copy_of() (or freeze()), which takes a full
// structural copy of a value_graph.

template <class Node, class Value>
class immutable_value_graph
{
public:
    typedef value_graph<Node, Value> graph_t;
    typedef Node node_t;
    typedef Value value_t;
    typedef typename graph_t::edge_descriptor edge_descriptor;

    typedef typename graph_t::node_iterator node_iterator;
    typedef typename graph_t::edge_iterator edge_iterator;
    typedef typename graph_t::out_edge_iterator out_edge_iterator;
    typedef typename graph_t::in_edge_iterator in_edge_iterator;
    typedef typename graph_t::adjacency_iterator adjacency_iterator;
    typedef typename graph_t::in_adjacency_iterator in_adjacency_iterator;

    // an empty directed graph
    immutable_value_graph() : _g(std::make_shared<const graph_t>()) {}

    static immutable_value_graph copy_of(const graph_t& g)
    {
        return immutable_value_graph(std::make_shared<const graph_t>(g));
    }

    // already immutable, nothing to copy
    static immutable_value_graph copy_of(const immutable_value_graph& g)
    {
        return g;
    }

    bool is_directed() const { return _g->is_directed(); }
    bool allows_self_loops() const { return _g->allows_self_loops(); }
    GraphType type() const { return _g->type().as_unmodifiable(); }

    size_t num_nodes() const { return _g->num_nodes(); }
    size_t num_edges() const { return _g->num_edges(); }

    const std::vector<Node>& nodes() const { return _g->nodes(); }
    boost::iterator_range<edge_iterator> edges() const { return _g->edges(); }

    bool contains_node(const Node& n) const { return _g->contains_node(n); }
    size_t position(const Node& n) const { return _g->position(n); }
    const Node& node_at(size_t i) const { return _g->node_at(i); }

    boost::iterator_range<adjacency_iterator> successors(const Node& n) const
    {
        return _g->successors(n);
    }

    boost::iterator_range<in_adjacency_iterator>
    predecessors(const Node& n) const
    {
        return _g->predecessors(n);
    }

    std::vector<Node> adjacent_nodes(const Node& n) const
    {
        return _g->adjacent_nodes(n);
    }

    boost::iterator_range<out_edge_iterator> out_edges(const Node& n) const
    {
        return _g->out_edges(n);
    }

    boost::iterator_range<in_edge_iterator> in_edges(const Node& n) const
    {
        return _g->in_edges(n);
    }

    std::vector<edge_descriptor> incident_edges(const Node& n) const
    {
        return _g->incident_edges(n);
    }

    size_t out_degree(const Node& n) const { return _g->out_degree(n); }
    size_t in_degree(const Node& n) const { return _g->in_degree(n); }
    size_t degree(const Node& n) const { return _g->degree(n); }

    bool has_edge_connecting(const Node& u, const Node& v) const
    {
        return _g->has_edge_connecting(u, v);
    }

    bool has_edge_connecting(const edge_descriptor& e) const
    {
        return _g->has_edge_connecting(e);
    }

    boost::optional<Value> edge_value(const Node& u, const Node& v) const
    {
        return _g->edge_value(u, v);
    }

    boost::optional<Value> edge_value(const edge_descriptor& e) const
    {
        return _g->edge_value(e);
    }

    // the frozen storage
    const graph_t& get_graph() const { return *_g; }

private:
    explicit immutable_value_graph(std::shared_ptr<const graph_t> g)
        : _g(std::move(g)) {}

    std::shared_ptr<const graph_t> _g;
};

template <class Node, class Value>
immutable_value_graph<Node, Value> freeze(const value_graph<Node, Value>& g)
{
    return immutable_value_graph<Node, Value>::copy_of(g);
}

namespace graphs
{

// mutable structural copies

template <class Node, class Value>
value_graph<Node, Value> copy_of(const value_graph<Node, Value>& g)
{
    return value_graph<Node, Value>(g);
}

template <class Node, class Value>
value_graph<Node, Value> copy_of(const immutable_value_graph<Node, Value>& g)
{
    return value_graph<Node, Value>(g.get_graph());
}

} // namespace graphs

} // namespace valgraph

#endif // IMMUTABLE_VALUE_GRAPH_HH
