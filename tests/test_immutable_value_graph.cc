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

#include <string>
#include <vector>

#include "immutable_value_graph.hh"
#include "test_helpers.hh"

using namespace valgraph;
using namespace test_utils;

typedef immutable_value_graph<std::string, double> frozen_graph;

TEST(ImmutableValueGraphTest, DefaultIsEmptyDirected)
{
    frozen_graph g;
    EXPECT_EQ(g.num_nodes(), 0u);
    EXPECT_EQ(g.num_edges(), 0u);
    EXPECT_TRUE(g.is_directed());
    EXPECT_FALSE(g.type().is_modifiable());
}

TEST(ImmutableValueGraphTest, FreezeTakesACopy)
{
    auto source = make_value_graph(true, {edge_entry("a", "b", 1.)});
    auto g = freeze(source);

    source.put_edge_value("b", "c", 2.);
    source.remove_edge("a", "b");

    EXPECT_EQ(g.num_nodes(), 2u);
    EXPECT_EQ(g.num_edges(), 1u);
    EXPECT_EQ(*g.edge_value("a", "b"), 1.);
    EXPECT_FALSE(g.contains_node("c"));
}

TEST(ImmutableValueGraphTest, CopiesShareStorage)
{
    auto g = freeze(make_value_graph(false, {edge_entry("a", "b", 1.)}));
    frozen_graph h(g);
    EXPECT_EQ(&g.get_graph(), &h.get_graph());
    EXPECT_EQ(&frozen_graph::copy_of(g).get_graph(), &g.get_graph());
}

TEST(ImmutableValueGraphTest, ForwardsQueries)
{
    auto g = freeze(make_value_graph(false, {edge_entry("a", "b", 1.),
                                             edge_entry("b", "c", 2.)}));
    EXPECT_FALSE(g.is_directed());
    EXPECT_TRUE(g.type().is_undirected());
    EXPECT_EQ(g.nodes(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(g.degree("b"), 2u);
    EXPECT_EQ(g.incident_edges("b").size(), 2u);
    EXPECT_EQ(g.adjacent_nodes("b"), (std::vector<std::string>{"a", "c"}));
    EXPECT_TRUE(g.has_edge_connecting(string_edge::unordered("c", "b")));
    EXPECT_EQ(*g.edge_value(string_edge::unordered("c", "b")), 2.);

    size_t n = 0;
    for (const auto& e : g.edges())
    {
        EXPECT_FALSE(e.is_ordered());
        ++n;
    }
    EXPECT_EQ(n, 2u);
}

TEST(ImmutableValueGraphTest, StructuralCopyBackToMutable)
{
    auto g = freeze(make_value_graph(true, {edge_entry("a", "b", 1.)}));
    auto m = graphs::copy_of(g);
    m.put_edge_value("b", "a", 5.);

    EXPECT_EQ(m.num_edges(), 2u);
    EXPECT_EQ(g.num_edges(), 1u);
    EXPECT_NE(&m, &g.get_graph());
}
