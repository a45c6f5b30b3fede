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

#include "graph_io.hh"

#include "debug_log.hh"
#include "graph_exceptions.hh"

#include <new>
#include <stdexcept>

#include <boost/archive/archive_exception.hpp>

using namespace std;
using namespace valgraph;

void valgraph::open_output_file(ofstream& stream, const string& file_name)
{
    stream.open(file_name, ios_base::out | ios_base::binary |
                           ios_base::trunc);
    if (!stream.is_open())
        throw IOException("error opening file '" + file_name +
                          "' for writing");
    stream.exceptions(ios_base::badbit);
    VALGRAPH_DEBUG_LOG("writing graph to '%s'", file_name.c_str());
}

void valgraph::open_input_file(ifstream& stream, const string& file_name)
{
    stream.open(file_name, ios_base::in | ios_base::binary);
    if (!stream.is_open())
        throw IOException("error opening file '" + file_name +
                          "' for reading");
    stream.exceptions(ios_base::badbit);
    VALGRAPH_DEBUG_LOG("reading graph from '%s'", file_name.c_str());
}

unique_ptr<boost::archive::binary_iarchive>
valgraph::open_input_archive(istream& stream)
{
    // a garbage header yields a huge signature length, which surfaces as an
    // allocation failure rather than an archive error
    try
    {
        return unique_ptr<boost::archive::binary_iarchive>
            (new boost::archive::binary_iarchive(stream));
    }
    catch (boost::archive::archive_exception& e)
    {
        throw IOException(string("invalid graph archive header: ") +
                          e.what());
    }
    catch (bad_alloc&)
    {
        throw IOException("invalid graph archive header");
    }
    catch (length_error&)
    {
        throw IOException("invalid graph archive header");
    }
}
