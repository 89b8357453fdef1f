#pragma once

#include <glib.h>
#include <memory>

namespace hapdb {

//
// Deleters for GLib-owned resources
//

struct GErrorDeleter {
    void operator()(GError* ptr) const {
        if (ptr) g_error_free(ptr);
    }
};

struct GCharDeleter {
    void operator()(gchar* ptr) const {
        if (ptr) g_free(ptr);
    }
};

struct GOptionContextDeleter {
    void operator()(GOptionContext* ptr) const {
        if (ptr) g_option_context_free(ptr);
    }
};

//
// Smart pointer aliases
//

using GErrorPtr = std::unique_ptr<GError, GErrorDeleter>;
using GCharPtr = std::unique_ptr<gchar, GCharDeleter>;
using GOptionContextPtr = std::unique_ptr<GOptionContext, GOptionContextDeleter>;

inline GErrorPtr makeGErrorPtr(GError* error) {
    return GErrorPtr(error);
}

inline GCharPtr makeGCharPtr(gchar* str) {
    return GCharPtr(str);
}

} // namespace hapdb
