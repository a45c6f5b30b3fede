// valgraph -- immutable value graph adaptors
//
// Copyright (C) 2026 The valgraph developers
// Copyright (C) 2006-2016 Tiago de Paula Peixoto <tiago@skewed.de>
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

#ifndef VALUE_GRAPH_HH
#define VALUE_GRAPH_HH

#include <vector>
#include <unordered_map>
#include <utility>
#include <algorithm>

#include <boost/optional.hpp>
#include <boost/iterator/iterator_facade.hpp>
#include <boost/iterator/transform_iterator.hpp>
#include <boost/range/iterator_range.hpp>

#include "endpoint_pair.hh"
#include "graph_exceptions.hh"
#include "graph_type.hh"

namespace valgraph
{

// ========================================================================
// value_graph<Node, Value>
// ========================================================================
//
// value_graph is a simple adjacency list implementation of a graph whose
// vertices are arbitrary (hashable) objects and whose edges carry an arbitrary
// value. It is either directed or undirected, may allow self-loops, and never
// has parallel edges: putting a value on an existing edge replaces the old
// value.
//
// The nodes are kept in a vector in insertion order, which is also the
// iteration order, together with a hash index from node to position. Each
// position has a list of out-edges, stored as (target position, value), and a
// list of in-neighbour positions. An undirected edge appears in the lists of
// both its endpoints (a self-loop only once), so that the out- and in-lists of
// an undirected graph always have the same contents.
//
// Iterators and ranges refer to the graph they were obtained from, and are
// invalidated by any modification.

template <class Node, class Value>
class value_graph
{
public:
    typedef Node node_t;
    typedef Value value_t;
    typedef endpoint_pair<Node> edge_descriptor;

    typedef std::vector<std::pair<size_t, Value>> out_list_t;
    typedef std::vector<size_t> in_list_t;

    explicit value_graph(bool directed = true, bool allows_self_loops = false)
        : _directed(directed), _allows_self_loops(allows_self_loops),
          _n_edges(0) {}

    struct get_out_node
    {
        get_out_node() : _g(nullptr) {}
        explicit get_out_node(const value_graph* g) : _g(g) {}
        const Node& operator()(const std::pair<size_t, Value>& e) const
        { return _g->_nodes[e.first]; }
        const value_graph* _g;
    };

    struct get_in_node
    {
        get_in_node() : _g(nullptr) {}
        explicit get_in_node(const value_graph* g) : _g(g) {}
        const Node& operator()(size_t u) const
        { return _g->_nodes[u]; }
        const value_graph* _g;
    };

    struct make_out_edge
    {
        make_out_edge() : _g(nullptr), _v(0) {}
        make_out_edge(const value_graph* g, size_t v) : _g(g), _v(v) {}
        edge_descriptor operator()(const std::pair<size_t, Value>& e) const
        { return _g->make_edge(_v, e.first); }
        const value_graph* _g;
        size_t _v;
    };

    struct make_in_edge
    {
        make_in_edge() : _g(nullptr), _v(0) {}
        make_in_edge(const value_graph* g, size_t v) : _g(g), _v(v) {}
        edge_descriptor operator()(size_t u) const
        { return _g->make_edge(u, _v); }
        const value_graph* _g;
        size_t _v;
    };

    typedef typename std::vector<Node>::const_iterator node_iterator;

    typedef boost::transform_iterator<get_out_node,
                                      typename out_list_t::const_iterator,
                                      const Node&, Node>
        adjacency_iterator;
    typedef boost::transform_iterator<get_in_node,
                                      typename in_list_t::const_iterator,
                                      const Node&, Node>
        in_adjacency_iterator;
    typedef boost::transform_iterator<make_out_edge,
                                      typename out_list_t::const_iterator,
                                      edge_descriptor, edge_descriptor>
        out_edge_iterator;
    typedef boost::transform_iterator<make_in_edge,
                                      typename in_list_t::const_iterator,
                                      edge_descriptor, edge_descriptor>
        in_edge_iterator;

    class edge_iterator:
        public boost::iterator_facade<edge_iterator,
                                      edge_descriptor,
                                      boost::forward_traversal_tag,
                                      edge_descriptor>
    {
    public:
        edge_iterator() : _g(nullptr), _v(0), _i(0) {}
        explicit edge_iterator(const value_graph* g, size_t v, size_t i)
            : _g(g), _v(v), _i(i)
        {
            // move position to first edge
            skip();
        }

    private:
        friend class boost::iterator_core_access;

        // skip empty lists, and visit undirected edges only from the endpoint
        // with the smallest position
        void skip()
        {
            const auto& oes = _g->_out_edges;
            while (_v < oes.size())
            {
                if (_i == oes[_v].size())
                {
                    ++_v;
                    _i = 0;
                    continue;
                }
                if (_g->_directed || oes[_v][_i].first >= _v)
                    break;
                ++_i;
            }
        }

        void increment()
        {
            ++_i;
            skip();
        }

        bool equal(edge_iterator const& other) const
        {
            return _v == other._v && _i == other._i;
        }

        edge_descriptor dereference() const
        {
            return _g->make_edge(_v, _g->_out_edges[_v][_i].first);
        }

        const value_graph* _g;
        size_t _v;
        size_t _i;
    };

    //
    // Queries
    //

    bool is_directed() const { return _directed; }
    bool allows_self_loops() const { return _allows_self_loops; }

    // a value graph is never a multigraph, and its values are not weights
    GraphType type() const
    {
        return GraphType(_directed, !_directed, _allows_self_loops, false,
                         false, true, true);
    }

    size_t num_nodes() const { return _nodes.size(); }
    size_t num_edges() const { return _n_edges; }

    const std::vector<Node>& nodes() const { return _nodes; }

    boost::iterator_range<edge_iterator> edges() const
    {
        return boost::make_iterator_range(edge_iterator(this, 0, 0),
                                          edge_iterator(this, _nodes.size(), 0));
    }

    bool contains_node(const Node& n) const
    {
        return _index.find(n) != _index.end();
    }

    // position of n in the node order
    size_t position(const Node& n) const
    {
        auto iter = _index.find(n);
        if (iter == _index.end())
            throw NoSuchNode("node is not an element of this graph");
        return iter->second;
    }

    const Node& node_at(size_t i) const { return _nodes[i]; }

    // (target position, value) entries of the node at position i
    const out_list_t& out_list(size_t i) const { return _out_edges[i]; }

    boost::iterator_range<adjacency_iterator> successors(const Node& n) const
    {
        const auto& oes = _out_edges[position(n)];
        return boost::make_iterator_range
            (adjacency_iterator(oes.begin(), get_out_node(this)),
             adjacency_iterator(oes.end(), get_out_node(this)));
    }

    boost::iterator_range<in_adjacency_iterator>
    predecessors(const Node& n) const
    {
        const auto& ies = _in_edges[position(n)];
        return boost::make_iterator_range
            (in_adjacency_iterator(ies.begin(), get_in_node(this)),
             in_adjacency_iterator(ies.end(), get_in_node(this)));
    }

    // successors and predecessors, each node once, in node order
    std::vector<Node> adjacent_nodes(const Node& n) const
    {
        size_t v = position(n);
        std::vector<size_t> pos;
        for (const auto& e : _out_edges[v])
            pos.push_back(e.first);
        pos.insert(pos.end(), _in_edges[v].begin(), _in_edges[v].end());
        std::sort(pos.begin(), pos.end());
        pos.erase(std::unique(pos.begin(), pos.end()), pos.end());

        std::vector<Node> ns;
        ns.reserve(pos.size());
        for (auto u : pos)
            ns.push_back(_nodes[u]);
        return ns;
    }

    boost::iterator_range<out_edge_iterator> out_edges(const Node& n) const
    {
        size_t v = position(n);
        const auto& oes = _out_edges[v];
        return boost::make_iterator_range
            (out_edge_iterator(oes.begin(), make_out_edge(this, v)),
             out_edge_iterator(oes.end(), make_out_edge(this, v)));
    }

    boost::iterator_range<in_edge_iterator> in_edges(const Node& n) const
    {
        size_t v = position(n);
        const auto& ies = _in_edges[v];
        return boost::make_iterator_range
            (in_edge_iterator(ies.begin(), make_in_edge(this, v)),
             in_edge_iterator(ies.end(), make_in_edge(this, v)));
    }

    // all the edges with n as an endpoint, each once
    std::vector<edge_descriptor> incident_edges(const Node& n) const
    {
        size_t v = position(n);
        std::vector<edge_descriptor> es;
        for (const auto& e : _out_edges[v])
            es.push_back(make_edge(v, e.first));
        if (_directed)
        {
            for (auto u : _in_edges[v])
            {
                if (u != v)
                    es.push_back(make_edge(u, v));
            }
        }
        return es;
    }

    size_t out_degree(const Node& n) const
    {
        if (!_directed)
            return degree(n);
        return _out_edges[position(n)].size();
    }

    size_t in_degree(const Node& n) const
    {
        if (!_directed)
            return degree(n);
        return _in_edges[position(n)].size();
    }

    // self-loops count twice
    size_t degree(const Node& n) const
    {
        size_t v = position(n);
        if (_directed)
            return _out_edges[v].size() + _in_edges[v].size();
        return _out_edges[v].size() + (has_self_loop(v) ? 1 : 0);
    }

    bool has_edge_connecting(const Node& u, const Node& v) const
    {
        return find_edge(u, v) != nullptr;
    }

    // unordered endpoints never match an edge of a directed graph
    bool has_edge_connecting(const edge_descriptor& e) const
    {
        if (!is_ordering_compatible(e))
            return false;
        return has_edge_connecting(e.node_u(), e.node_v());
    }

    boost::optional<Value> edge_value(const Node& u, const Node& v) const
    {
        auto e = find_edge(u, v);
        if (e == nullptr)
            return boost::none;
        return e->second;
    }

    boost::optional<Value> edge_value(const edge_descriptor& e) const
    {
        if (!is_ordering_compatible(e))
            return boost::none;
        return edge_value(e.node_u(), e.node_v());
    }

    //
    // Modification
    //

    // returns false if n was already present
    bool add_node(const Node& n)
    {
        if (contains_node(n))
            return false;
        _index.emplace(n, _nodes.size());
        _nodes.push_back(n);
        _out_edges.emplace_back();
        _in_edges.emplace_back();
        return true;
    }

    // Sets the value of the edge (u, v), adding the edge and its endpoints if
    // necessary. Returns the previous value, if the edge already existed.
    boost::optional<Value> put_edge_value(const Node& u, const Node& v,
                                          const Value& value)
    {
        if (!_allows_self_loops && u == v)
            throw ValueException("cannot add a self-loop to a graph which "
                                 "does not allow self-loops");
        add_node(u);
        add_node(v);
        size_t s = position(u);
        size_t t = position(v);

        auto iter = find_out(s, t);
        if (iter != _out_edges[s].end())
        {
            Value old = iter->second;
            iter->second = value;
            if (!_directed && s != t)
                find_out(t, s)->second = value;
            return old;
        }

        _out_edges[s].emplace_back(t, value);
        _in_edges[t].push_back(s);
        if (!_directed && s != t)
        {
            _out_edges[t].emplace_back(s, value);
            _in_edges[s].push_back(t);
        }
        _n_edges++;
        return boost::none;
    }

    // Removes the edge (u, v), returning its value, if it existed.
    boost::optional<Value> remove_edge(const Node& u, const Node& v)
    {
        if (!contains_node(u) || !contains_node(v))
            return boost::none;
        size_t s = position(u);
        size_t t = position(v);

        auto iter = find_out(s, t);
        if (iter == _out_edges[s].end())
            return boost::none;

        Value old = iter->second;
        _out_edges[s].erase(iter);
        erase_in(t, s);
        if (!_directed && s != t)
        {
            _out_edges[t].erase(find_out(t, s));
            erase_in(s, t);
        }
        _n_edges--;
        return old;
    }

    // Removes n and all its incident edges. O(V + E)
    bool remove_node(const Node& n)
    {
        auto niter = _index.find(n);
        if (niter == _index.end())
            return false;
        size_t v = niter->second;

        if (_directed)
            _n_edges -= (_out_edges[v].size() + _in_edges[v].size() -
                         (has_self_loop(v) ? 1 : 0));
        else
            _n_edges -= _out_edges[v].size();

        // detach the incident edges from the neighbours
        for (const auto& e : _out_edges[v])
        {
            size_t t = e.first;
            if (t == v)
                continue;
            erase_in(t, v);
            if (!_directed)
                _out_edges[t].erase(find_out(t, v));
        }
        if (_directed)
        {
            for (auto u : _in_edges[v])
            {
                if (u != v)
                    _out_edges[u].erase(find_out(u, v));
            }
        }

        _index.erase(niter);
        _nodes.erase(_nodes.begin() + v);
        _out_edges.erase(_out_edges.begin() + v);
        _in_edges.erase(_in_edges.begin() + v);

        // shift the positions after v
        for (auto& i : _index)
        {
            if (i.second > v)
                i.second--;
        }
        for (auto& oes : _out_edges)
        {
            for (auto& e : oes)
            {
                if (e.first > v)
                    e.first--;
            }
        }
        for (auto& ies : _in_edges)
        {
            for (auto& u : ies)
            {
                if (u > v)
                    u--;
            }
        }
        return true;
    }

private:
    edge_descriptor make_edge(size_t s, size_t t) const
    {
        return edge_descriptor::of(_directed, _nodes[s], _nodes[t]);
    }

    bool is_ordering_compatible(const edge_descriptor& e) const
    {
        return e.is_ordered() || !_directed;
    }

    bool has_self_loop(size_t v) const
    {
        const auto& oes = _out_edges[v];
        return std::any_of(oes.begin(), oes.end(),
                           [&](const auto& e) -> bool { return e.first == v; });
    }

    typename out_list_t::iterator find_out(size_t s, size_t t)
    {
        auto& oes = _out_edges[s];
        return std::find_if(oes.begin(), oes.end(),
                            [&](const auto& e) -> bool { return e.first == t; });
    }

    const std::pair<size_t, Value>* find_edge(const Node& u,
                                              const Node& v) const
    {
        auto su = _index.find(u);
        auto tv = _index.find(v);
        if (su == _index.end() || tv == _index.end())
            return nullptr;
        size_t t = tv->second;
        const auto& oes = _out_edges[su->second];
        auto iter = std::find_if(oes.begin(), oes.end(),
                                 [&](const auto& e) -> bool
                                 { return e.first == t; });
        if (iter == oes.end())
            return nullptr;
        return &*iter;
    }

    void erase_in(size_t t, size_t s)
    {
        auto& ies = _in_edges[t];
        auto iter = std::find(ies.begin(), ies.end(), s);
        if (iter != ies.end())
            ies.erase(iter);
    }

    bool _directed;
    bool _allows_self_loops;
    std::vector<Node> _nodes;
    std::unordered_map<Node, size_t> _index;
    std::vector<out_list_t> _out_edges;
    std::vector<in_list_t> _in_edges;
    size_t _n_edges;
};

} // namespace valgraph

#endif // VALUE_GRAPH_HH
