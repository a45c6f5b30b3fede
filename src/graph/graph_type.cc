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

#include "graph_type.hh"

#include <ostream>

using namespace std;
using namespace valgraph;

GraphType::GraphType()
    : _directed(true), _undirected(false), _self_loops(false),
      _multiple_edges(false), _weighted(false), _cycles(true),
      _modifiable(true) {}

GraphType::GraphType(bool directed, bool undirected, bool self_loops,
                     bool multiple_edges, bool weighted, bool cycles,
                     bool modifiable)
    : _directed(directed), _undirected(undirected), _self_loops(self_loops),
      _multiple_edges(multiple_edges), _weighted(weighted), _cycles(cycles),
      _modifiable(modifiable) {}

GraphType GraphType::directed_simple()
{
    return GraphType(true, false, false, false, false, true, true);
}

GraphType GraphType::undirected_simple()
{
    return GraphType(false, true, false, false, false, true, true);
}

GraphType GraphType::directed_pseudograph()
{
    return GraphType(true, false, true, true, false, true, true);
}

GraphType GraphType::undirected_pseudograph()
{
    return GraphType(false, true, true, true, false, true, true);
}

GraphType GraphType::as_directed() const
{
    GraphType t(*this);
    t._directed = true;
    t._undirected = false;
    return t;
}

GraphType GraphType::as_undirected() const
{
    GraphType t(*this);
    t._directed = false;
    t._undirected = true;
    return t;
}

GraphType GraphType::as_mixed() const
{
    GraphType t(*this);
    t._directed = true;
    t._undirected = true;
    return t;
}

GraphType GraphType::as_weighted() const
{
    GraphType t(*this);
    t._weighted = true;
    return t;
}

GraphType GraphType::as_unweighted() const
{
    GraphType t(*this);
    t._weighted = false;
    return t;
}

GraphType GraphType::as_modifiable() const
{
    GraphType t(*this);
    t._modifiable = true;
    return t;
}

GraphType GraphType::as_unmodifiable() const
{
    GraphType t(*this);
    t._modifiable = false;
    return t;
}

bool GraphType::operator==(const GraphType& other) const
{
    return (_directed == other._directed &&
            _undirected == other._undirected &&
            _self_loops == other._self_loops &&
            _multiple_edges == other._multiple_edges &&
            _weighted == other._weighted &&
            _cycles == other._cycles &&
            _modifiable == other._modifiable);
}

string GraphType::to_string() const
{
    string s;
    if (is_mixed())
        s = "mixed";
    else if (_directed)
        s = "directed";
    else if (_undirected)
        s = "undirected";
    else
        s = "edgeless";

    if (_self_loops && _multiple_edges)
        s += " pseudograph";
    else if (_multiple_edges)
        s += " multigraph";
    else if (_self_loops)
        s += " graph with self-loops";
    else
        s += " simple graph";

    if (_weighted)
        s += ", weighted";
    if (!_cycles)
        s += ", acyclic";
    if (!_modifiable)
        s += ", unmodifiable";
    return s;
}

ostream& valgraph::operator<<(ostream& out, const GraphType& type)
{
    return out << type.to_string();
}
