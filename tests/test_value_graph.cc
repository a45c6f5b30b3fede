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

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "graph_exceptions.hh"
#include "test_helpers.hh"
#include "value_graph.hh"

using namespace valgraph;
using namespace test_utils;

namespace
{

template <class Range>
std::vector<typename Range::value_type> to_vector(const Range& r)
{
    return std::vector<typename Range::value_type>(r.begin(), r.end());
}

std::vector<std::string> sorted(std::vector<std::string> v)
{
    std::sort(v.begin(), v.end());
    return v;
}

} // namespace

TEST(ValueGraphTest, EmptyGraph)
{
    string_graph g;
    EXPECT_TRUE(g.is_directed());
    EXPECT_FALSE(g.allows_self_loops());
    EXPECT_EQ(g.num_nodes(), 0u);
    EXPECT_EQ(g.num_edges(), 0u);
    EXPECT_TRUE(g.edges().empty());
    EXPECT_TRUE(g.type().is_modifiable());
    EXPECT_FALSE(g.type().is_weighted());
}

TEST(ValueGraphTest, NodesKeepInsertionOrder)
{
    string_graph g;
    EXPECT_TRUE(g.add_node("c"));
    EXPECT_TRUE(g.add_node("a"));
    EXPECT_FALSE(g.add_node("c"));
    EXPECT_TRUE(g.add_node("b"));
    EXPECT_EQ(g.nodes(), (std::vector<std::string>{"c", "a", "b"}));
    EXPECT_EQ(g.position("a"), 1u);
    EXPECT_EQ(g.node_at(2), "b");
    EXPECT_THROW(g.position("z"), NoSuchNode);
}

TEST(ValueGraphTest, PutEdgeValueAddsEndpointsAndReplaces)
{
    string_graph g;
    EXPECT_FALSE(g.put_edge_value("a", "b", 1.));
    EXPECT_EQ(g.num_nodes(), 2u);
    EXPECT_EQ(g.num_edges(), 1u);

    auto old = g.put_edge_value("a", "b", 2.);
    ASSERT_TRUE(old);
    EXPECT_EQ(*old, 1.);
    EXPECT_EQ(g.num_edges(), 1u);
    EXPECT_EQ(*g.edge_value("a", "b"), 2.);
    EXPECT_FALSE(g.edge_value("b", "a"));
}

TEST(ValueGraphTest, SelfLoopsRejectedUnlessAllowed)
{
    string_graph g;
    EXPECT_THROW(g.put_edge_value("a", "a", 1.), ValueException);
    EXPECT_EQ(g.num_nodes(), 0u);

    string_graph h(true, true);
    h.put_edge_value("a", "a", 1.);
    EXPECT_TRUE(h.has_edge_connecting("a", "a"));
    EXPECT_EQ(h.degree("a"), 2u);
    EXPECT_EQ(h.out_degree("a"), 1u);
    EXPECT_EQ(h.in_degree("a"), 1u);
}

TEST(ValueGraphTest, DirectedAdjacency)
{
    auto g = make_value_graph(true, {edge_entry("a", "b", 1.),
                                     edge_entry("c", "a", 2.)});
    EXPECT_EQ(to_vector(g.successors("a")), std::vector<std::string>{"b"});
    EXPECT_EQ(to_vector(g.predecessors("a")), std::vector<std::string>{"c"});
    EXPECT_EQ(g.adjacent_nodes("a"), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(g.out_degree("a"), 1u);
    EXPECT_EQ(g.in_degree("a"), 1u);
    EXPECT_EQ(g.degree("a"), 2u);

    auto out = to_vector(g.out_edges("a"));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], string_edge::ordered("a", "b"));

    auto in = to_vector(g.in_edges("a"));
    ASSERT_EQ(in.size(), 1u);
    EXPECT_EQ(in[0], string_edge::ordered("c", "a"));

    EXPECT_THROW(g.successors("z"), NoSuchNode);
}

TEST(ValueGraphTest, UndirectedEdgesAreSymmetric)
{
    auto g = make_value_graph(false, {edge_entry("a", "b", 1.),
                                      edge_entry("b", "c", 2.)});
    EXPECT_EQ(g.num_edges(), 2u);
    EXPECT_TRUE(g.has_edge_connecting("b", "a"));
    EXPECT_EQ(*g.edge_value("c", "b"), 2.);
    EXPECT_TRUE(g.has_edge_connecting(string_edge::unordered("c", "b")));
    EXPECT_TRUE(g.has_edge_connecting(string_edge::ordered("c", "b")));
    EXPECT_EQ(g.degree("b"), 2u);
    EXPECT_EQ(g.out_degree("b"), 2u);
    EXPECT_EQ(g.in_degree("b"), 2u);
    EXPECT_EQ(sorted(to_vector(g.successors("b"))),
              (std::vector<std::string>{"a", "c"}));

    // each edge once
    auto es = to_vector(g.edges());
    ASSERT_EQ(es.size(), 2u);
    EXPECT_NE(std::find(es.begin(), es.end(), string_edge::unordered("a", "b")),
              es.end());
    EXPECT_NE(std::find(es.begin(), es.end(), string_edge::unordered("b", "c")),
              es.end());

    g.put_edge_value("b", "a", 3.);
    EXPECT_EQ(*g.edge_value("a", "b"), 3.);
    EXPECT_EQ(g.num_edges(), 2u);
}

TEST(ValueGraphTest, UnorderedPairNeverMatchesDirectedEdge)
{
    auto g = make_value_graph(true, {edge_entry("a", "b", 1.)});
    EXPECT_TRUE(g.has_edge_connecting(string_edge::ordered("a", "b")));
    EXPECT_FALSE(g.has_edge_connecting(string_edge::unordered("a", "b")));
    EXPECT_FALSE(g.edge_value(string_edge::unordered("a", "b")));
}

TEST(ValueGraphTest, IncidentEdges)
{
    auto g = make_value_graph(true, {edge_entry("a", "b", 1.),
                                     edge_entry("b", "b", 1.),
                                     edge_entry("c", "b", 2.)}, true);
    auto es = g.incident_edges("b");
    EXPECT_EQ(es.size(), 3u);
    EXPECT_EQ(g.degree("b"), 4u);
}

TEST(ValueGraphTest, RemoveEdge)
{
    auto g = make_value_graph(false, {edge_entry("a", "b", 1.),
                                      edge_entry("b", "c", 2.)});
    auto old = g.remove_edge("b", "a");
    ASSERT_TRUE(old);
    EXPECT_EQ(*old, 1.);
    EXPECT_EQ(g.num_edges(), 1u);
    EXPECT_FALSE(g.has_edge_connecting("a", "b"));
    EXPECT_EQ(g.degree("a"), 0u);
    EXPECT_FALSE(g.remove_edge("a", "b"));
    EXPECT_FALSE(g.remove_edge("x", "y"));
}

TEST(ValueGraphTest, RemoveNodeShiftsPositions)
{
    auto g = make_value_graph(true, {edge_entry("a", "b", 1.),
                                     edge_entry("b", "c", 2.),
                                     edge_entry("c", "d", 3.),
                                     edge_entry("d", "b", 4.)});
    EXPECT_TRUE(g.remove_node("b"));
    EXPECT_FALSE(g.remove_node("b"));

    EXPECT_EQ(g.nodes(), (std::vector<std::string>{"a", "c", "d"}));
    EXPECT_EQ(g.position("c"), 1u);
    EXPECT_EQ(g.position("d"), 2u);
    EXPECT_EQ(g.num_edges(), 1u);
    EXPECT_EQ(*g.edge_value("c", "d"), 3.);
    EXPECT_EQ(g.out_degree("a"), 0u);
    EXPECT_EQ(g.in_degree("c"), 0u);
    EXPECT_EQ(to_vector(g.successors("c")), std::vector<std::string>{"d"});
}

TEST(ValueGraphTest, RemoveNodeUndirected)
{
    auto g = make_value_graph(false, {edge_entry("a", "b", 1.),
                                      edge_entry("b", "b", 1.),
                                      edge_entry("b", "c", 2.),
                                      edge_entry("a", "c", 3.)}, true);
    EXPECT_EQ(g.num_edges(), 4u);
    g.remove_node("b");
    EXPECT_EQ(g.num_edges(), 1u);
    EXPECT_EQ(g.degree("a"), 1u);
    EXPECT_EQ(g.degree("c"), 1u);
    EXPECT_EQ(*g.edge_value("c", "a"), 3.);
}

TEST(ValueGraphTest, CopyIsIndependent)
{
    auto g = make_value_graph(true, {edge_entry("a", "b", 1.)});
    string_graph h(g);
    g.put_edge_value("b", "c", 2.);
    g.remove_edge("a", "b");
    EXPECT_EQ(h.num_nodes(), 2u);
    EXPECT_EQ(h.num_edges(), 1u);
    EXPECT_EQ(*h.edge_value("a", "b"), 1.);
}
