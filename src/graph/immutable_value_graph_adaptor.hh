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

#ifndef IMMUTABLE_VALUE_GRAPH_ADAPTOR_HH
#define IMMUTABLE_VALUE_GRAPH_ADAPTOR_HH

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <boost/config.hpp>
#include <boost/graph/graph_traits.hpp>
#include <boost/graph/properties.hpp>
#include <boost/property_map/property_map.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_member.hpp>

#include "debug_log.hh"
#include "graph_exceptions.hh"
#include "immutable_value_graph.hh"
#include "value_graph_adaptor.hh"

namespace valgraph
{

//==============================================================================
// ImmutableValueGraphAdaptor
// A weighted view of an immutable_value_graph. All queries are answered by
// ValueGraphAdaptorBase; every mutation, including setting an edge weight, is
// rejected with UnsupportedOperation and leaves the graph untouched.
//
// Copies of the adaptor share both the frozen storage and the converter.
// clone() instead takes a structural copy of the graph, so that the clone
// does not share storage with the original, while still sharing the
// converter.
//
// The adaptor can be persisted with any Boost.Serialization archive. The
// record is, in order: the converter, the graph type, the vertex count, the
// vertices, the edge count and one (source, target, value) triple per edge.
//==============================================================================
template <class Node, class Value, class Converter = identity_weight>
class ImmutableValueGraphAdaptor
    : public ValueGraphAdaptorBase<Node, Value, Converter,
                                   immutable_value_graph<Node, Value>>
{
public:
    static_assert(is_persistable_converter<Converter>::value,
                  "the weight converter must be default constructible and "
                  "serializable");

    typedef immutable_value_graph<Node, Value> graph_t;
    typedef ValueGraphAdaptorBase<Node, Value, Converter, graph_t> base_t;
    typedef typename base_t::edge_t edge_t;

    // an empty directed graph, with a default converter
    ImmutableValueGraphAdaptor()
        : base_t(graph_t(), std::make_shared<const Converter>()) {}

    explicit ImmutableValueGraphAdaptor(const graph_t& g,
                                        const Converter& converter = Converter())
        : base_t(g, std::make_shared<const Converter>(converter)) {}

    ImmutableValueGraphAdaptor(const graph_t& g,
                               std::shared_ptr<const Converter> converter)
        : base_t(g, std::move(converter)) {}

    GraphType get_type() const
    {
        return base_t::get_type().as_unmodifiable();
    }

    bool add_vertex(const Node&) { reject_mutation(); }
    edge_t add_edge(const Node&, const Node&) { reject_mutation(); }
    bool add_edge(const Node&, const Node&, const edge_t&) { reject_mutation(); }
    bool remove_vertex(const Node&) { reject_mutation(); }
    edge_t remove_edge(const Node&, const Node&) { reject_mutation(); }
    bool remove_edge(const edge_t&) { reject_mutation(); }
    void set_edge_weight(const edge_t&, double) { reject_mutation(); }

    BOOST_NORETURN static void reject_mutation()
    {
        throw UnsupportedOperation("graph is immutable");
    }

    ImmutableValueGraphAdaptor clone() const
    {
        VALGRAPH_DEBUG_LOG("cloning graph with %zu vertices and %zu edges",
                           this->num_vertices(), this->num_edges());
        graph_t g;
        try
        {
            g = graph_t::copy_of(graphs::copy_of(this->_g));
        }
        catch (std::exception& e)
        {
            throw StructuralCopyFailure(typeid(Node), typeid(Value), e.what());
        }
        return ImmutableValueGraphAdaptor(g, this->_converter);
    }

private:
    friend class boost::serialization::access;

    template <class Archive>
    void save(Archive& ar, const unsigned int) const
    {
        using boost::serialization::make_nvp;

        const graph_t& g = this->_g;
        const size_t max_count = std::numeric_limits<int32_t>::max();
        if (g.num_nodes() > max_count || g.num_edges() > max_count)
            throw ValueException("graph too large to be persisted: " +
                                 std::to_string(g.num_nodes()) +
                                 " vertices, " +
                                 std::to_string(g.num_edges()) + " edges");

        ar << make_nvp("converter", *this->_converter);

        const GraphType type = get_type();
        ar << make_nvp("type", type);

        const int32_t n = g.num_nodes();
        ar << make_nvp("n", n);
        for (const auto& v : g.nodes())
            ar << make_nvp("vertex", v);

        // Boost.Serialization writes a tracked object as a reference to one
        // already saved at the same address, so every object written must
        // live at its own address until the end of the save. Values are
        // written from the storage, endpoints from a copy per edge.
        const auto& store = g.get_graph();
        std::vector<edge_t> es;
        std::vector<const Value*> values;
        es.reserve(g.num_edges());
        values.reserve(g.num_edges());
        for (size_t s = 0; s < store.num_nodes(); ++s)
        {
            for (const auto& e : store.out_list(s))
            {
                if (!store.is_directed() && e.first < s)
                    continue;
                es.push_back(edge_t::of(store.is_directed(), store.node_at(s),
                                        store.node_at(e.first)));
                values.push_back(&e.second);
            }
        }

        const int32_t m = es.size();
        ar << make_nvp("m", m);
        for (size_t i = 0; i < es.size(); ++i)
        {
            ar << make_nvp("source", es[i].node_u())
               << make_nvp("target", es[i].node_v())
               << make_nvp("value", *values[i]);
        }

        VALGRAPH_DEBUG_LOG("saved graph with %d vertices and %d edges", n, m);
    }

    // Everything is read into locals first, so that a failed read leaves the
    // adaptor as it was.
    template <class Archive>
    void load(Archive& ar, const unsigned int)
    {
        using boost::serialization::make_nvp;

        Converter converter;
        ar >> make_nvp("converter", converter);

        GraphType type;
        ar >> make_nvp("type", type);
        if (type.is_mixed() || type.is_allowing_multiple_edges())
            throw UnsupportedGraphShape("cannot read graph of type '" +
                                        type.to_string() + "': mixed graphs "
                                        "and multiple edges are not "
                                        "supported");

        value_graph<Node, Value> g(type.is_directed(),
                                   type.is_allowing_self_loops());

        int32_t n = 0;
        ar >> make_nvp("n", n);
        if (n < 0)
            throw IOException("invalid vertex count: " + std::to_string(n));
        for (int32_t i = 0; i < n; ++i)
        {
            Node v;
            ar >> make_nvp("vertex", v);
            g.add_node(v);
        }

        int32_t m = 0;
        ar >> make_nvp("m", m);
        if (m < 0)
            throw IOException("invalid edge count: " + std::to_string(m));
        for (int32_t i = 0; i < m; ++i)
        {
            Node s, t;
            Value value;
            ar >> make_nvp("source", s)
               >> make_nvp("target", t)
               >> make_nvp("value", value);
            g.put_edge_value(s, t, value);
        }

        graph_t frozen = graph_t::copy_of(g);
        auto converter_ptr = std::make_shared<const Converter>(converter);
        this->_g = std::move(frozen);
        this->_converter = std::move(converter_ptr);

        VALGRAPH_DEBUG_LOG("loaded graph with %d vertices and %d edges", n, m);
    }

    BOOST_SERIALIZATION_SPLIT_MEMBER()
};

//==============================================================================
// value_graph_traversal_tag
//==============================================================================
struct value_graph_traversal_tag
    : public boost::vertex_list_graph_tag,
      public boost::edge_list_graph_tag,
      public boost::bidirectional_graph_tag,
      public boost::adjacency_graph_tag {};

//==============================================================================
// value_weight_map
// The edge weights, as computed by the converter. Writes are rejected.
//==============================================================================
template <class Node, class Value, class Converter>
class value_weight_map
{
public:
    typedef ImmutableValueGraphAdaptor<Node, Value, Converter> graph_t;
    typedef endpoint_pair<Node> key_type;
    typedef double value_type;
    typedef double reference;
    typedef boost::read_write_property_map_tag category;

    value_weight_map() : _g(nullptr) {}
    explicit value_weight_map(const graph_t& g) : _g(&g) {}

    reference operator[](const key_type& e) const
    {
        return _g->get_edge_weight(e);
    }

private:
    const graph_t* _g;
};

template <class Node, class Value, class Converter>
inline double
get(const value_weight_map<Node, Value, Converter>& pmap,
    const endpoint_pair<Node>& e)
{
    return pmap[e];
}

template <class Node, class Value, class Converter>
inline void
put(const value_weight_map<Node, Value, Converter>&,
    const endpoint_pair<Node>&, double)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// value_index_map
// The position of each vertex in the vertex set, for algorithms which need
// a vertex index.
//==============================================================================
template <class Node, class Value, class Converter>
class value_index_map
    : public boost::put_get_helper<size_t,
                                   value_index_map<Node, Value, Converter>>
{
public:
    typedef ImmutableValueGraphAdaptor<Node, Value, Converter> graph_t;
    typedef Node key_type;
    typedef size_t value_type;
    typedef size_t reference;
    typedef boost::readable_property_map_tag category;

    value_index_map() : _g(nullptr) {}
    explicit value_index_map(const graph_t& g) : _g(&g) {}

    reference operator[](const key_type& v) const
    {
        return _g->get_graph().position(v);
    }

private:
    const graph_t* _g;
};

} // namespace valgraph

namespace boost
{

//==============================================================================
// graph_traits<ImmutableValueGraphAdaptor>
// An undirected value graph reports each incident edge both as an out-edge
// and as an in-edge.
//==============================================================================
template <class Node, class Value, class Converter>
struct graph_traits<valgraph::ImmutableValueGraphAdaptor<Node, Value,
                                                         Converter>>
{
    typedef valgraph::immutable_value_graph<Node, Value> graph_t;

    typedef Node vertex_descriptor;
    typedef valgraph::endpoint_pair<Node> edge_descriptor;

    typedef typename graph_t::node_iterator vertex_iterator;
    typedef typename graph_t::edge_iterator edge_iterator;
    typedef typename graph_t::out_edge_iterator out_edge_iterator;
    typedef typename graph_t::in_edge_iterator in_edge_iterator;
    typedef typename graph_t::adjacency_iterator adjacency_iterator;

    typedef bidirectional_tag directed_category;
    typedef disallow_parallel_edge_tag edge_parallel_category;
    typedef valgraph::value_graph_traversal_tag traversal_category;

    typedef size_t vertices_size_type;
    typedef size_t edges_size_type;
    typedef size_t degree_size_type;

    static vertex_descriptor null_vertex() { return Node(); }
};

template <class Node, class Value, class Converter>
struct property_map<valgraph::ImmutableValueGraphAdaptor<Node, Value,
                                                         Converter>,
                    edge_weight_t>
{
    typedef valgraph::value_weight_map<Node, Value, Converter> type;
    typedef type const_type;
};

template <class Node, class Value, class Converter>
struct property_map<valgraph::ImmutableValueGraphAdaptor<Node, Value,
                                                         Converter>,
                    vertex_index_t>
{
    typedef valgraph::value_index_map<Node, Value, Converter> type;
    typedef type const_type;
};

} // namespace boost

namespace valgraph
{

//==============================================================================
// source(e,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline const Node&
source(const endpoint_pair<Node>& e,
       const ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    return e.node_u();
}

//==============================================================================
// target(e,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline const Node&
target(const endpoint_pair<Node>& e,
       const ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    return e.node_v();
}

//==============================================================================
// vertices(g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<typename immutable_value_graph<Node, Value>::node_iterator,
                 typename immutable_value_graph<Node, Value>::node_iterator>
vertices(const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    const auto& vs = g.vertex_set();
    return std::make_pair(vs.begin(), vs.end());
}

//==============================================================================
// edges(g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<typename immutable_value_graph<Node, Value>::edge_iterator,
                 typename immutable_value_graph<Node, Value>::edge_iterator>
edges(const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    auto es = g.edge_set();
    return std::make_pair(es.begin(), es.end());
}

//==============================================================================
// edge(u, v, g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<endpoint_pair<Node>, bool>
edge(const Node& u, const Node& v,
     const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return std::make_pair(endpoint_pair<Node>::of(g.get_graph().is_directed(),
                                                  u, v),
                          g.contains_edge(u, v));
}

//==============================================================================
// out_edges(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<typename immutable_value_graph<Node, Value>::out_edge_iterator,
                 typename immutable_value_graph<Node, Value>::out_edge_iterator>
out_edges(const Node& u,
          const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    auto es = g.get_graph().out_edges(u);
    return std::make_pair(es.begin(), es.end());
}

//==============================================================================
// in_edges(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<typename immutable_value_graph<Node, Value>::in_edge_iterator,
                 typename immutable_value_graph<Node, Value>::in_edge_iterator>
in_edges(const Node& u,
         const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    auto es = g.get_graph().in_edges(u);
    return std::make_pair(es.begin(), es.end());
}

//==============================================================================
// adjacent_vertices(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<typename immutable_value_graph<Node, Value>::adjacency_iterator,
                 typename immutable_value_graph<Node, Value>::adjacency_iterator>
adjacent_vertices(const Node& u,
                  const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    auto vs = g.get_graph().successors(u);
    return std::make_pair(vs.begin(), vs.end());
}

//==============================================================================
// num_vertices(g)
//==============================================================================
template <class Node, class Value, class Converter>
inline size_t
num_vertices(const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return g.num_vertices();
}

//==============================================================================
// num_edges(g)
//==============================================================================
template <class Node, class Value, class Converter>
inline size_t
num_edges(const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return g.num_edges();
}

//==============================================================================
// out_degree(u,g)
// The length of out_edges(u,g). Unlike out_degree_of(), an undirected
// self-loop is counted once.
//==============================================================================
template <class Node, class Value, class Converter>
inline size_t
out_degree(const Node& u,
           const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return g.get_graph().out_edges(u).size();
}

//==============================================================================
// in_degree(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline size_t
in_degree(const Node& u,
          const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return g.get_graph().in_edges(u).size();
}

//==============================================================================
// degree(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline size_t
degree(const Node& u,
       const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return g.degree_of(u);
}

//==============================================================================
// add_vertex(g)
//==============================================================================
template <class Node, class Value, class Converter>
inline Node
add_vertex(ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// add_vertex(v,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline Node
add_vertex(const Node&, ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// clear_vertex(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline void
clear_vertex(const Node&, ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// remove_vertex(u,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline void
remove_vertex(const Node&,
              ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// add_edge(u,v,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<endpoint_pair<Node>, bool>
add_edge(const Node&, const Node&,
         ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// add_edge(u,v,value,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline std::pair<endpoint_pair<Node>, bool>
add_edge(const Node&, const Node&, const Value&,
         ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// remove_edge(u,v,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline void
remove_edge(const Node&, const Node&,
            ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// remove_edge(e,g)
//==============================================================================
template <class Node, class Value, class Converter>
inline void
remove_edge(const endpoint_pair<Node>&,
            ImmutableValueGraphAdaptor<Node, Value, Converter>&)
{
    ImmutableValueGraphAdaptor<Node, Value, Converter>::reject_mutation();
}

//==============================================================================
// get(edge_weight, g), get(vertex_index, g)
//==============================================================================
template <class Node, class Value, class Converter>
inline value_weight_map<Node, Value, Converter>
get(boost::edge_weight_t,
    const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return value_weight_map<Node, Value, Converter>(g);
}

template <class Node, class Value, class Converter>
inline double
get(boost::edge_weight_t,
    const ImmutableValueGraphAdaptor<Node, Value, Converter>& g,
    const endpoint_pair<Node>& e)
{
    return g.get_edge_weight(e);
}

template <class Node, class Value, class Converter>
inline value_index_map<Node, Value, Converter>
get(boost::vertex_index_t,
    const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    return value_index_map<Node, Value, Converter>(g);
}

template <class Node, class Value, class Converter>
inline size_t
get(boost::vertex_index_t,
    const ImmutableValueGraphAdaptor<Node, Value, Converter>& g,
    const Node& v)
{
    return g.get_graph().position(v);
}

} // namespace valgraph

#endif // IMMUTABLE_VALUE_GRAPH_ADAPTOR_HH
