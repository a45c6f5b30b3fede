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

#ifndef ENDPOINT_PAIR_HH
#define ENDPOINT_PAIR_HH

#include <functional>
#include <ostream>
#include <utility>

#include <boost/functional/hash.hpp>

#include "graph_exceptions.hh"

namespace valgraph
{

// ========================================================================
// endpoint_pair<Node>
// ========================================================================
//
// The two nodes of an edge. In directed graphs the pair is ordered, i.e. it
// has a source and a target, and (u, v) and (v, u) are different edges. In
// undirected graphs the pair is unordered, and (u, v) == (v, u). An ordered
// pair never compares equal to an unordered one.
//
// Since value graphs do not have parallel edges, the endpoints are enough to
// identify an edge, and the pair is used directly as the edge descriptor.

template <class Node>
class endpoint_pair
{
public:
    typedef Node node_t;

    endpoint_pair() : _u(), _v(), _ordered(true) {}

    static endpoint_pair ordered(const Node& source, const Node& target)
    {
        return endpoint_pair(source, target, true);
    }

    static endpoint_pair unordered(const Node& u, const Node& v)
    {
        return endpoint_pair(u, v, false);
    }

    // an ordered pair if the graph is directed, otherwise an unordered one
    static endpoint_pair of(bool directed, const Node& u, const Node& v)
    {
        return endpoint_pair(u, v, directed);
    }

    const Node& node_u() const { return _u; }
    const Node& node_v() const { return _v; }
    bool is_ordered() const { return _ordered; }

    const Node& source() const
    {
        if (!_ordered)
            throw UnsupportedOperation("cannot call source() on an unordered "
                                       "endpoint pair");
        return _u;
    }

    const Node& target() const
    {
        if (!_ordered)
            throw UnsupportedOperation("cannot call target() on an unordered "
                                       "endpoint pair");
        return _v;
    }

    // the endpoint opposite to n
    const Node& adjacent_node(const Node& n) const
    {
        if (n == _u)
            return _v;
        if (n == _v)
            return _u;
        throw NoSuchNode("node is not an endpoint of this edge");
    }

    bool operator==(const endpoint_pair& other) const
    {
        if (_ordered != other._ordered)
            return false;
        if (_ordered)
            return _u == other._u && _v == other._v;
        return ((_u == other._u && _v == other._v) ||
                (_u == other._v && _v == other._u));
    }

    bool operator!=(const endpoint_pair& other) const
    {
        return !(*this == other);
    }

private:
    endpoint_pair(const Node& u, const Node& v, bool ordered)
        : _u(u), _v(v), _ordered(ordered) {}

    Node _u, _v;
    bool _ordered;
};

template <class Node>
std::ostream& operator<<(std::ostream& out, const endpoint_pair<Node>& e)
{
    if (e.is_ordered())
        return out << "<" << e.node_u() << " -> " << e.node_v() << ">";
    return out << "[" << e.node_u() << ", " << e.node_v() << "]";
}

} // namespace valgraph

// hashing of endpoint pairs, consistent with operator==

namespace std
{

template <class Node>
struct hash<valgraph::endpoint_pair<Node>>
{
    std::size_t operator()(const valgraph::endpoint_pair<Node>& e) const
    {
        std::size_t hu = _h(e.node_u());
        std::size_t hv = _h(e.node_v());
        if (!e.is_ordered())
            return hu + hv;
        std::size_t seed = hu;
        boost::hash_combine(seed, hv);
        return seed;
    }
    std::hash<Node> _h;
};

} // namespace std

#endif // ENDPOINT_PAIR_HH
