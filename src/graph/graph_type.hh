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

#ifndef GRAPH_TYPE_HH
#define GRAPH_TYPE_HH

#include <iosfwd>
#include <string>

#include <boost/serialization/nvp.hpp>

namespace valgraph
{

// GraphType
// Summary of the shape of a graph: whether its edges are directed, undirected
// or both (mixed), whether it allows self-loops and parallel edges, whether it
// carries edge weights and whether it can be modified. It is a plain value;
// the as_*() methods return modified copies.

class GraphType
{
public:
    // an empty, directed, simple, unweighted and modifiable graph type
    GraphType();
    GraphType(bool directed, bool undirected, bool self_loops,
              bool multiple_edges, bool weighted, bool cycles,
              bool modifiable);

    static GraphType directed_simple();
    static GraphType undirected_simple();
    static GraphType directed_pseudograph();
    static GraphType undirected_pseudograph();

    bool is_directed() const { return _directed && !_undirected; }
    bool is_undirected() const { return _undirected && !_directed; }
    bool is_mixed() const { return _directed && _undirected; }
    bool is_allowing_self_loops() const { return _self_loops; }
    bool is_allowing_multiple_edges() const { return _multiple_edges; }
    bool is_weighted() const { return _weighted; }
    bool is_allowing_cycles() const { return _cycles; }
    bool is_modifiable() const { return _modifiable; }

    bool is_simple() const { return !_self_loops && !_multiple_edges; }
    bool is_pseudograph() const { return _self_loops && _multiple_edges; }
    bool is_multigraph() const { return !_self_loops && _multiple_edges; }

    GraphType as_directed() const;
    GraphType as_undirected() const;
    GraphType as_mixed() const;
    GraphType as_weighted() const;
    GraphType as_unweighted() const;
    GraphType as_modifiable() const;
    GraphType as_unmodifiable() const;

    bool operator==(const GraphType& other) const;
    bool operator!=(const GraphType& other) const { return !(*this == other); }

    std::string to_string() const;

    // persisted as a single record
    template <class Archive>
    void serialize(Archive& ar, const unsigned int)
    {
        ar & boost::serialization::make_nvp("directed", _directed)
           & boost::serialization::make_nvp("undirected", _undirected)
           & boost::serialization::make_nvp("self_loops", _self_loops)
           & boost::serialization::make_nvp("multiple_edges", _multiple_edges)
           & boost::serialization::make_nvp("weighted", _weighted)
           & boost::serialization::make_nvp("cycles", _cycles)
           & boost::serialization::make_nvp("modifiable", _modifiable);
    }

private:
    bool _directed;
    bool _undirected;
    bool _self_loops;
    bool _multiple_edges;
    bool _weighted;
    bool _cycles;
    bool _modifiable;
};

std::ostream& operator<<(std::ostream& out, const GraphType& type);

} // namespace valgraph

#endif // GRAPH_TYPE_HH
