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

#include <functional>
#include <stdexcept>
#include <string>

#include "graph_exceptions.hh"
#include "immutable_value_graph_adaptor.hh"
#include "test_helpers.hh"

using namespace valgraph;
using namespace test_utils;

namespace
{

// a node whose copies can be made to fail
struct fragile_node
{
    static bool fail_copies;

    explicit fragile_node(int i = 0) : id(i) {}

    fragile_node(const fragile_node& other) : id(other.id)
    {
        if (fail_copies)
            throw std::runtime_error("fragile node copy failed");
    }

    fragile_node& operator=(const fragile_node& other)
    {
        if (fail_copies)
            throw std::runtime_error("fragile node copy failed");
        id = other.id;
        return *this;
    }

    bool operator==(const fragile_node& other) const { return id == other.id; }

    int id;
};

bool fragile_node::fail_copies = false;

} // namespace

namespace std
{
template <>
struct hash<fragile_node>
{
    size_t operator()(const fragile_node& n) const
    {
        return std::hash<int>()(n.id);
    }
};
} // namespace std

TEST(CloneTest, CloneHasSameContent)
{
    auto a = make_triangle();
    auto b = a.clone();

    EXPECT_EQ(b.vertex_set(), a.vertex_set());
    EXPECT_EQ(b.num_edges(), a.num_edges());
    for (const auto& e : a.edge_set())
    {
        ASSERT_TRUE(b.contains_edge(e));
        EXPECT_EQ(b.get_edge_weight(e), a.get_edge_weight(e));
    }
    EXPECT_EQ(b.get_type(), a.get_type());
}

TEST(CloneTest, CloneOwnsDistinctStorage)
{
    auto a = make_triangle();
    auto b = a.clone();
    EXPECT_NE(&b.get_graph().get_graph(), &a.get_graph().get_graph());
}

TEST(CloneTest, CloneSharesConverter)
{
    auto g = freeze(make_value_graph(true, {edge_entry("a", "b", 2.)}));
    ImmutableValueGraphAdaptor<std::string, double, scaled_weight>
        a(g, scaled_weight(3.));
    auto b = a.clone();
    EXPECT_EQ(b.get_converter_ptr(), a.get_converter_ptr());
    EXPECT_EQ(b.get_edge_weight("a", "b"), 6.);
}

TEST(CloneTest, CopySharesStorage)
{
    auto a = make_triangle();
    string_adaptor c(a);
    EXPECT_EQ(&c.get_graph().get_graph(), &a.get_graph().get_graph());
    EXPECT_EQ(c.get_converter_ptr(), a.get_converter_ptr());
}

TEST(CloneTest, CloneIsIndependentOfSource)
{
    auto source = make_value_graph(false, {edge_entry("x", "y", 1.)});
    string_adaptor a(freeze(source));
    auto b = a.clone();

    source.put_edge_value("y", "z", 2.);
    source.remove_edge("x", "y");

    EXPECT_EQ(b.num_vertices(), 2u);
    EXPECT_EQ(b.num_edges(), 1u);
    EXPECT_EQ(b.get_edge_weight("y", "x"), 1.);
    EXPECT_FALSE(b.contains_vertex("z"));
}

TEST(CloneTest, CloneOfEmptyGraph)
{
    string_adaptor a;
    auto b = a.clone();
    EXPECT_EQ(b.num_vertices(), 0u);
    EXPECT_TRUE(b.get_type().is_directed());
}

TEST(CloneTest, CopyFailureIsWrapped)
{
    value_graph<fragile_node, double> m;
    m.put_edge_value(fragile_node(1), fragile_node(2), 1.);
    ImmutableValueGraphAdaptor<fragile_node, double> a(freeze(m));

    fragile_node::fail_copies = true;
    try
    {
        a.clone();
        fragile_node::fail_copies = false;
        FAIL() << "clone did not fail";
    }
    catch (StructuralCopyFailure& e)
    {
        fragile_node::fail_copies = false;
        EXPECT_EQ(e.get_cause(), "fragile node copy failed");
        std::string msg = e.what();
        EXPECT_NE(msg.find("fragile node copy failed"), std::string::npos);
        EXPECT_NE(msg.find("fragile_node"), std::string::npos);
    }
    fragile_node::fail_copies = false;

    // the original is untouched
    EXPECT_EQ(a.num_vertices(), 2u);
    EXPECT_EQ(a.get_edge_weight(fragile_node(1), fragile_node(2)), 1.);
}
