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
#include "graph_io.hh"
#include "immutable_value_graph_adaptor.hh"
#include "value_graph.hh"

#include <boost/archive/archive_exception.hpp>
#include <boost/python.hpp>
#include <boost/serialization/string.hpp>

#include <sstream>
#include <string>

using namespace std;
using namespace boost;
using namespace valgraph;

namespace valgraph
{

typedef value_graph<string, double> py_value_graph;
typedef ImmutableValueGraphAdaptor<string, double, scaled_weight> py_graph;

template <class Value>
python::object to_object(const boost::optional<Value>& value)
{
    if (!value)
        return python::object();
    return python::object(*value);
}

//==============================================================================
// ValueGraph
//==============================================================================

python::object put_edge_value(py_value_graph& g, const string& u,
                              const string& v, double value)
{
    return to_object(g.put_edge_value(u, v, value));
}

python::object remove_edge_value(py_value_graph& g, const string& u,
                                 const string& v)
{
    return to_object(g.remove_edge(u, v));
}

python::object get_edge_value(const py_value_graph& g, const string& u,
                              const string& v)
{
    return to_object(g.edge_value(u, v));
}

python::list get_nodes(const py_value_graph& g)
{
    python::list nodes;
    for (const auto& v : g.nodes())
        nodes.append(v);
    return nodes;
}

py_graph freeze_graph(const py_value_graph& g, double factor)
{
    return py_graph(freeze(g), scaled_weight(factor));
}

py_graph freeze_graph_unscaled(const py_value_graph& g)
{
    return freeze_graph(g, 1.);
}

//==============================================================================
// ImmutableGraph
//==============================================================================

python::list get_vertices(const py_graph& g)
{
    python::list vertices;
    for (const auto& v : g.vertex_set())
        vertices.append(v);
    return vertices;
}

python::list get_edges(const py_graph& g)
{
    python::list edges;
    for (const auto& e : g.edge_set())
        edges.append(python::make_tuple(e.node_u(), e.node_v()));
    return edges;
}

double get_edge_weight(const py_graph& g, const string& u, const string& v)
{
    return g.get_edge_weight(u, v);
}

bool contains_edge(const py_graph& g, const string& u, const string& v)
{
    return g.contains_edge(u, v);
}

string get_graph_type(const py_graph& g)
{
    return g.get_type().to_string();
}

bool is_directed(const py_graph& g)
{
    return g.get_type().is_directed();
}

double get_factor(const py_graph& g)
{
    return g.get_converter().get_factor();
}

void do_add_vertex(py_graph&, const string&)
{
    py_graph::reject_mutation();
}

void do_add_edge(py_graph&, const string&, const string&)
{
    py_graph::reject_mutation();
}

void do_remove_vertex(py_graph&, const string&)
{
    py_graph::reject_mutation();
}

void do_remove_edge(py_graph&, const string&, const string&)
{
    py_graph::reject_mutation();
}

void do_set_edge_weight(py_graph&, const string&, const string&, double)
{
    py_graph::reject_mutation();
}

// pickling goes through the binary wire format
struct graph_pickle_suite : python::pickle_suite
{
    static python::tuple getstate(const py_graph& g)
    {
        ostringstream stream;
        write_graph(stream, g);
        string data = stream.str();
        python::object bytes(python::handle<>
                             (PyBytes_FromStringAndSize(data.data(),
                                                        data.size())));
        return python::make_tuple(bytes);
    }

    static void setstate(py_graph& g, python::tuple state)
    {
        if (python::len(state) != 1)
            throw ValueException("invalid pickled graph state");
        python::object bytes = state[0];
        char* buffer = nullptr;
        Py_ssize_t size = 0;
        if (PyBytes_AsStringAndSize(bytes.ptr(), &buffer, &size) != 0)
            python::throw_error_already_set();
        istringstream stream(string(buffer, size));
        g = read_graph<py_graph>(stream);
    }
};

struct translate_exception
{
    translate_exception(PyObject* type) : _type(type) {}

    template <class Exception>
    void operator()(const Exception& e) const
    {
        PyErr_SetString(_type, e.what());
    }

    PyObject* _type;
};

} // namespace valgraph

// register everything

void export_python_interface()
{
    using namespace boost::python;

    // the most recently registered translator is tried first
    register_exception_translator<GraphException>
        (translate_exception(PyExc_RuntimeError));
    register_exception_translator<ValueException>
        (translate_exception(PyExc_ValueError));
    register_exception_translator<IOException>
        (translate_exception(PyExc_IOError));
    register_exception_translator<boost::archive::archive_exception>
        (translate_exception(PyExc_IOError));
    register_exception_translator<NoSuchNode>
        (translate_exception(PyExc_KeyError));
    register_exception_translator<NoSuchEdge>
        (translate_exception(PyExc_KeyError));
    register_exception_translator<UnsupportedOperation>
        (translate_exception(PyExc_NotImplementedError));

    class_<py_value_graph>("ValueGraph",
                           "Mutable graph with a double value on each edge.",
                           init<boost::python::optional<bool, bool>>())
        .def("add_node", &py_value_graph::add_node,
             "Add a node, returning whether it was not already present.")
        .def("put_edge_value", valgraph::put_edge_value,
             "Set the value of an edge, returning the previous one.")
        .def("remove_node", &py_value_graph::remove_node,
             "Remove a node and its incident edges.")
        .def("remove_edge", remove_edge_value,
             "Remove an edge, returning its value.")
        .def("edge_value", valgraph::get_edge_value)
        .def("nodes", get_nodes)
        .def("num_nodes", &py_value_graph::num_nodes)
        .def("num_edges", &py_value_graph::num_edges)
        .def("is_directed", &py_value_graph::is_directed)
        .def("freeze", freeze_graph,
             "Return an immutable copy, with weights scaled by the given "
             "factor.")
        .def("freeze", freeze_graph_unscaled);

    class_<py_graph>("ImmutableGraph", init<>())
        .def("vertices", get_vertices)
        .def("edges", get_edges)
        .def("edge_weight", get_edge_weight,
             "Return the weight of the edge between two vertices.")
        .def("contains_vertex", &py_graph::contains_vertex)
        .def("contains_edge", valgraph::contains_edge)
        .def("degree", &py_graph::degree_of)
        .def("in_degree", &py_graph::in_degree_of)
        .def("out_degree", &py_graph::out_degree_of)
        .def("num_vertices", &py_graph::num_vertices)
        .def("num_edges", &py_graph::num_edges)
        .def("graph_type", get_graph_type)
        .def("is_directed", valgraph::is_directed)
        .def("weight_factor", get_factor)
        .def("clone", &py_graph::clone,
             "Return a copy which does not share storage with this graph.")
        .def("add_vertex", do_add_vertex)
        .def("add_edge", do_add_edge)
        .def("remove_vertex", do_remove_vertex)
        .def("remove_edge", do_remove_edge)
        .def("set_edge_weight", do_set_edge_weight)
        .def_pickle(graph_pickle_suite());
}

BOOST_PYTHON_MODULE(libvalgraph_core)
{
    boost::python::scope().attr("__version__") = PACKAGE_VERSION;
    export_python_interface();
}
