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

#include <cstring>
#include <new>
#include <sstream>
#include <string>
#include <unordered_set>

#include "endpoint_pair.hh"
#include "graph_exceptions.hh"

using namespace valgraph;

typedef endpoint_pair<std::string> edge_t;

TEST(EndpointPairTest, OrderedPairHasSourceAndTarget)
{
    auto e = edge_t::ordered("u", "v");
    EXPECT_TRUE(e.is_ordered());
    EXPECT_EQ(e.source(), "u");
    EXPECT_EQ(e.target(), "v");
    EXPECT_EQ(e.node_u(), "u");
    EXPECT_EQ(e.node_v(), "v");
}

TEST(EndpointPairTest, DefaultPairIsValueInitialized)
{
    typedef endpoint_pair<int> int_edge;
    alignas(int_edge) unsigned char buffer[sizeof(int_edge)];
    std::memset(buffer, 0xff, sizeof(buffer));

    int_edge* e = new (buffer) int_edge;
    EXPECT_TRUE(e->is_ordered());
    EXPECT_EQ(e->node_u(), 0);
    EXPECT_EQ(e->node_v(), 0);
    e->~int_edge();
}

TEST(EndpointPairTest, UnorderedPairRejectsSourceAndTarget)
{
    auto e = edge_t::unordered("u", "v");
    EXPECT_FALSE(e.is_ordered());
    EXPECT_THROW(e.source(), UnsupportedOperation);
    EXPECT_THROW(e.target(), UnsupportedOperation);
}

TEST(EndpointPairTest, OfFollowsDirectedness)
{
    EXPECT_TRUE(edge_t::of(true, "u", "v").is_ordered());
    EXPECT_FALSE(edge_t::of(false, "u", "v").is_ordered());
}

TEST(EndpointPairTest, Equality)
{
    EXPECT_EQ(edge_t::ordered("u", "v"), edge_t::ordered("u", "v"));
    EXPECT_NE(edge_t::ordered("u", "v"), edge_t::ordered("v", "u"));
    EXPECT_EQ(edge_t::unordered("u", "v"), edge_t::unordered("v", "u"));
    EXPECT_NE(edge_t::ordered("u", "v"), edge_t::unordered("u", "v"));
}

TEST(EndpointPairTest, HashIsConsistentWithEquality)
{
    std::hash<edge_t> h;
    EXPECT_EQ(h(edge_t::unordered("u", "v")), h(edge_t::unordered("v", "u")));

    std::unordered_set<edge_t> es;
    es.insert(edge_t::unordered("u", "v"));
    es.insert(edge_t::unordered("v", "u"));
    es.insert(edge_t::ordered("u", "v"));
    EXPECT_EQ(es.size(), 2u);
}

TEST(EndpointPairTest, AdjacentNode)
{
    auto e = edge_t::unordered("u", "v");
    EXPECT_EQ(e.adjacent_node("u"), "v");
    EXPECT_EQ(e.adjacent_node("v"), "u");
    EXPECT_THROW(e.adjacent_node("w"), NoSuchNode);
}

TEST(EndpointPairTest, Printing)
{
    std::ostringstream ordered, unordered;
    ordered << edge_t::ordered("u", "v");
    unordered << edge_t::unordered("u", "v");
    EXPECT_EQ(ordered.str(), "<u -> v>");
    EXPECT_EQ(unordered.str(), "[u, v]");
}
