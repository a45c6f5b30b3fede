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

#include "debug_log.hh"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace
{
std::atomic<valgraph::debug::debug_callback_t> _debug_callback(nullptr);
}

void valgraph::debug::set_debug_callback(debug_callback_t cb)
{
    _debug_callback.store(cb, std::memory_order_release);
}

void valgraph::debug::clear_debug_callback()
{
    _debug_callback.store(nullptr, std::memory_order_release);
}

void valgraph::debug::debug_output(const char* fmt, ...)
{
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char message[1100];
    snprintf(message, sizeof(message), "[" PACKAGE_NAME "][DEBUG] %s", buffer);

    debug_callback_t cb = _debug_callback.load(std::memory_order_acquire);
    if (cb != nullptr)
    {
        cb(message);
    }
    else
    {
        fprintf(stderr, "%s\n", message);
        fflush(stderr);
    }
}
