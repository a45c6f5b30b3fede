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

#ifndef GRAPH_IO_HH
#define GRAPH_IO_HH

#include <fstream>
#include <iosfwd>
#include <memory>
#include <string>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/nvp.hpp>

#include "immutable_value_graph_adaptor.hh"

namespace valgraph
{

// Binary persistence of immutable value graph adaptors. A stream without a
// valid archive header is reported as IOException, as are malformed contents
// (with subclasses for the specific cases). Errors from the archive after the
// header (e.g. a truncated stream) are reported as
// boost::archive::archive_exception.

void open_output_file(std::ofstream& stream, const std::string& file_name);
void open_input_file(std::ifstream& stream, const std::string& file_name);

// opens a binary archive on the stream, reporting an unreadable header as
// IOException
std::unique_ptr<boost::archive::binary_iarchive>
open_input_archive(std::istream& stream);

template <class Node, class Value, class Converter>
void write_graph(std::ostream& stream,
                 const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    boost::archive::binary_oarchive oa(stream);
    oa << boost::serialization::make_nvp("graph", g);
}

template <class Graph>
Graph read_graph(std::istream& stream)
{
    auto ia = open_input_archive(stream);
    Graph g;
    *ia >> boost::serialization::make_nvp("graph", g);
    return g;
}

template <class Node, class Value, class Converter>
void write_graph(const std::string& file_name,
                 const ImmutableValueGraphAdaptor<Node, Value, Converter>& g)
{
    std::ofstream stream;
    open_output_file(stream, file_name);
    write_graph(stream, g);
}

template <class Graph>
Graph read_graph(const std::string& file_name)
{
    std::ifstream stream;
    open_input_file(stream, file_name);
    return read_graph<Graph>(stream);
}

} // namespace valgraph

#endif // GRAPH_IO_HH
