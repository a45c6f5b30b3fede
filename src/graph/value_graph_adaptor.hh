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

#ifndef VALUE_GRAPH_ADAPTOR_HH
#define VALUE_GRAPH_ADAPTOR_HH

#include <memory>
#include <vector>

#include <boost/config.hpp>
#include <boost/optional.hpp>
#include <boost/range/iterator_range.hpp>

#include "endpoint_pair.hh"
#include "graph_exceptions.hh"
#include "graph_type.hh"
#include "weight_converters.hh"

namespace valgraph
{

//==============================================================================
// ValueGraphAdaptorBase
// This class encapsulates a value graph and provides a view of it as a
// weighted graph whose vertices are the nodes of the value graph, whose edges
// are its endpoint pairs and whose edge weights are computed from the edge
// values by a weight converter.
// Encapsulated graph can be: value_graph, immutable_value_graph
// Only read access is provided here. The view holds no state other than the
// graph and the converter, so concurrent readers are safe whenever the
// encapsulated graph is.
//==============================================================================
template <class Node, class Value, class Converter, class Graph>
class ValueGraphAdaptorBase
{
public:
    static_assert(is_weight_converter<Converter, Value>::value,
                  "the weight converter must map a const Value& to a value "
                  "convertible to double");

    typedef Node vertex_t;
    typedef endpoint_pair<Node> edge_t;
    typedef Value value_t;
    typedef Converter converter_t;
    typedef Graph graph_type;

    typedef typename Graph::edge_iterator edge_iterator;
    typedef typename Graph::out_edge_iterator out_edge_iterator;
    typedef typename Graph::in_edge_iterator in_edge_iterator;

    ValueGraphAdaptorBase(const Graph& g,
                          std::shared_ptr<const Converter> converter)
        : _g(g), _converter(std::move(converter))
    {
        if (_converter == nullptr)
            throw ValueException("the weight converter cannot be null");
    }

    const Graph& get_graph() const { return _g; }
    const Converter& get_converter() const { return *_converter; }

    const std::shared_ptr<const Converter>& get_converter_ptr() const
    {
        return _converter;
    }

    // weighted, and with the directedness and self-loop policy of the
    // encapsulated graph
    GraphType get_type() const
    {
        bool directed = _g.is_directed();
        return GraphType(directed, !directed, _g.allows_self_loops(), false,
                         true, true, true);
    }

    size_t num_vertices() const { return _g.num_nodes(); }
    size_t num_edges() const { return _g.num_edges(); }

    const std::vector<Node>& vertex_set() const { return _g.nodes(); }
    boost::iterator_range<edge_iterator> edge_set() const { return _g.edges(); }

    bool contains_vertex(const Node& v) const { return _g.contains_node(v); }

    bool contains_edge(const edge_t& e) const
    {
        return _g.has_edge_connecting(e);
    }

    bool contains_edge(const Node& u, const Node& v) const
    {
        return _g.has_edge_connecting(u, v);
    }

    boost::optional<edge_t> get_edge(const Node& u, const Node& v) const
    {
        if (!_g.has_edge_connecting(u, v))
            return boost::none;
        return edge_t::of(_g.is_directed(), u, v);
    }

    // there are no parallel edges, so this is at most one edge
    std::vector<edge_t> get_all_edges(const Node& u, const Node& v) const
    {
        std::vector<edge_t> es;
        auto e = get_edge(u, v);
        if (e)
            es.push_back(*e);
        return es;
    }

    std::vector<edge_t> edges_of(const Node& v) const
    {
        return _g.incident_edges(v);
    }

    std::vector<edge_t> incoming_edges_of(const Node& v) const
    {
        auto range = _g.in_edges(v);
        return std::vector<edge_t>(range.begin(), range.end());
    }

    std::vector<edge_t> outgoing_edges_of(const Node& v) const
    {
        auto range = _g.out_edges(v);
        return std::vector<edge_t>(range.begin(), range.end());
    }

    size_t degree_of(const Node& v) const { return _g.degree(v); }
    size_t in_degree_of(const Node& v) const { return _g.in_degree(v); }
    size_t out_degree_of(const Node& v) const { return _g.out_degree(v); }

    const Node& get_edge_source(const edge_t& e) const
    {
        check_edge(e);
        return e.node_u();
    }

    const Node& get_edge_target(const edge_t& e) const
    {
        check_edge(e);
        return e.node_v();
    }

    Value get_edge_value(const edge_t& e) const
    {
        auto value = _g.edge_value(e);
        if (!value)
            throw NoSuchEdge("no such edge in graph");
        return *value;
    }

    double get_edge_weight(const edge_t& e) const
    {
        auto value = _g.edge_value(e);
        if (!value)
            throw NoSuchEdge("no such edge in graph");
        return (*_converter)(*value);
    }

    double get_edge_weight(const Node& u, const Node& v) const
    {
        return get_edge_weight(edge_t::of(_g.is_directed(), u, v));
    }

protected:
    void check_edge(const edge_t& e) const
    {
        if (!_g.has_edge_connecting(e))
            throw NoSuchEdge("no such edge in graph");
    }

    Graph _g;
    std::shared_ptr<const Converter> _converter;
};

} // namespace valgraph

#endif // VALUE_GRAPH_ADAPTOR_HH
