/**
 * @file GLibPtr.hpp
 * @brief unique_ptr aliases owning GLib allocations
 */

#pragma once

#include <glib.h>

#include <memory>

namespace util {

struct GFreeDeleter {
    void operator()(gchar* p) const { g_free(p); }
};

struct GErrorDeleter {
    void operator()(GError* e) const { g_error_free(e); }
};

struct GStrvDeleter {
    void operator()(gchar** v) const { g_strfreev(v); }
};

using GCharPtr = std::unique_ptr<gchar, GFreeDeleter>;
using GErrorPtr = std::unique_ptr<GError, GErrorDeleter>;
using GStrvPtr = std::unique_ptr<gchar*, GStrvDeleter>;

}  // namespace util
