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

#include "config.h"

#include "graph_exceptions.hh"
#include "demangle.hh"

using namespace std;
using namespace valgraph;

GraphException::GraphException(const string& error) : _error(error) {}
GraphException::~GraphException() throw () {}
const char * GraphException::what() const throw () { return _error.c_str(); }

IOException::IOException(const string& error) : GraphException(error) {}
IOException::~IOException() throw () {}

ValueException::ValueException(const string& error) : GraphException(error) {}
ValueException::~ValueException() throw () {}

UnsupportedOperation::UnsupportedOperation(const string& error)
    : GraphException(error) {}
UnsupportedOperation::~UnsupportedOperation() throw () {}

NoSuchNode::NoSuchNode(const string& error) : ValueException(error) {}
NoSuchNode::~NoSuchNode() throw () {}

NoSuchEdge::NoSuchEdge(const string& error) : ValueException(error) {}
NoSuchEdge::~NoSuchEdge() throw () {}

UnsupportedGraphShape::UnsupportedGraphShape(const string& error)
    : IOException(error) {}
UnsupportedGraphShape::~UnsupportedGraphShape() throw () {}

StructuralCopyFailure::StructuralCopyFailure(const type_info& node,
                                             const type_info& value,
                                             const string& cause)
    : GraphException(""), _cause(cause)
{
    _error =
        "The structural copy of a graph failed. This should not happen with "
        "well-behaved node and value types; if you believe it is a " PACKAGE_NAME
        " bug, please submit a report at " PACKAGE_BUGREPORT ". What follows "
        "is debug information.\n\n";

    _error += "Node type: " + name_demangle(node.name()) + "\n\n";
    _error += "Value type: " + name_demangle(value.name()) + "\n\n";
    _error += "Cause: " + _cause + "\n";
}
StructuralCopyFailure::~StructuralCopyFailure() throw () {}
