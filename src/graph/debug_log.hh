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

#ifndef DEBUG_LOG_HH
#define DEBUG_LOG_HH

#include "config.h"

namespace valgraph
{
namespace debug
{

// Receives one formatted message, without trailing newline. When no callback
// is installed the messages go to stderr.
typedef void (*debug_callback_t)(const char* message);

void set_debug_callback(debug_callback_t cb);
void clear_debug_callback();

void debug_output(const char* fmt, ...)
    __attribute__((format(printf, 1, 2)));

} // namespace debug
} // namespace valgraph

#ifdef VALGRAPH_ENABLE_DEBUG_OUTPUT
    #define VALGRAPH_DEBUG_LOG(fmt, ...) \
        ::valgraph::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define VALGRAPH_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // DEBUG_LOG_HH
