#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace ac
{
struct debug_string_config
{
    // soft limit, checked before each element is appended
    isize max_length = 100;
};

// Developer-facing rendering of a value for assertion messages and test output.
// Not a serialization format: the output is lossy and may change.
//
// First match wins:
//   string-like           "text"
//   char                  'c' (control characters escaped)
//   bool                  true / false
//   arithmetic            std::format("{}")
//   to_string(v) via ADL, then v.to_string()
//   assoc_set             {x0, x1, ...}        most recent first
//   assoc_dict            {k0: v0, k1: v1}     most recent first
//   ranges                [v0, v1, ...]
//   tuple-likes           (v0, v1, ...)
//   anything else         hex dump of the object bytes, 0xAABBCCDD_EEFF
//
// Collections stop with ", ..." once the output reaches cfg.max_length.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

template <class K, class V>
[[nodiscard]] std::string to_debug_string(assoc_dict<K, V> const& d, debug_string_config const& cfg = {});

template <class K>
[[nodiscard]] std::string to_debug_string(assoc_set<K> const& s, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
// appends ", elem", or ", ..." once max_length is reached (then returns false)
template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += ac::to_debug_string(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    (void)(ac::impl::to_debug_string_append_elem(s, get<I>(v), cfg) && ...);
}

inline void append_escaped_char(std::string& s, char c)
{
    switch (c)
    {
    case '\0': s += "\\0"; break;
    case '\n': s += "\\n"; break;
    case '\r': s += "\\r"; break;
    case '\t': s += "\\t"; break;
    case '\\': s += "\\\\"; break;
    case '\'': s += "\\'"; break;
    default:
        if (c >= 0 && c < 32)
            s += std::format("\\x{:02X}", static_cast<unsigned char>(c));
        else if (c == 127)
            s += "\\x7F";
        else
            s += c;
    }
}
} // namespace impl

template <class T>
std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");
        impl::append_escaped_char(s, v);
        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::format("{}", v);
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = (unsigned char const*)&v;
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}

template <class K, class V>
std::string to_debug_string(assoc_dict<K, V> const& d, debug_string_config const& cfg)
{
    auto s = std::string("{");
    for (auto const& [key, value] : d.entries())
    {
        if (isize(s.size()) >= cfg.max_length)
        {
            s += ", ...";
            break;
        }
        if (s.size() > 1)
            s += ", ";
        s += ac::to_debug_string(key, cfg);
        s += ": ";
        s += ac::to_debug_string(value, cfg);
    }
    s += "}";
    return s;
}

template <class K>
std::string to_debug_string(assoc_set<K> const& set, debug_string_config const& cfg)
{
    auto s = std::string("{");
    for (auto const& e : set.to_list())
        if (!impl::to_debug_string_append_elem(s, e, cfg))
            break;
    s += "}";
    return s;
}
} // namespace ac
