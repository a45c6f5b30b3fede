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

#ifndef GRAPH_EXCEPTIONS_HH
#define GRAPH_EXCEPTIONS_HH

#include <string>
#include <typeinfo>
#include <exception>

// Exceptions thrown by the graph classes and adaptors. Everything derives from
// GraphException, so callers which do not care about the details can catch
// only that.

namespace valgraph
{

class GraphException : public std::exception
{
public:
    GraphException(const std::string& error);
    virtual ~GraphException() throw ();
    virtual const char * what () const throw ();
protected:
    std::string _error;
};

class IOException : public GraphException
{
public:
    IOException(const std::string& error);
    virtual ~IOException() throw ();
};

class ValueException : public GraphException
{
public:
    ValueException(const std::string& error);
    virtual ~ValueException() throw ();
};

// thrown by every mutating operation of a read-only graph
class UnsupportedOperation : public GraphException
{
public:
    UnsupportedOperation(const std::string& error);
    virtual ~UnsupportedOperation() throw ();
};

class NoSuchNode : public ValueException
{
public:
    NoSuchNode(const std::string& error);
    virtual ~NoSuchNode() throw ();
};

class NoSuchEdge : public ValueException
{
public:
    NoSuchEdge(const std::string& error);
    virtual ~NoSuchEdge() throw ();
};

// a persisted graph declares a shape (mixed or multiple edges) which cannot be
// reconstructed
class UnsupportedGraphShape : public IOException
{
public:
    UnsupportedGraphShape(const std::string& error);
    virtual ~UnsupportedGraphShape() throw ();
};

// The structural copy of a graph failed. This is never expected to happen, and
// indicates a broken node or value type (or an exhausted environment).
class StructuralCopyFailure : public GraphException
{
public:
    StructuralCopyFailure(const std::type_info& node,
                          const std::type_info& value,
                          const std::string& cause);
    virtual ~StructuralCopyFailure() throw ();

    const std::string& get_cause() const { return _cause; }

private:
    std::string _cause;
};

} // namespace valgraph

#endif // GRAPH_EXCEPTIONS_HH
