#pragma once

#include <cstddef>
#include <type_traits>
#include <etl/string.h>
#include <etl/to_string.h>

namespace yard {

  /**
   * customization point used by snformat to print one argument into a string.
   * the default prints anything etl::to_string understands.
   */
  template<class T, class Enable = void>
  struct to_stringer {
    void operator()(const T &value, ::etl::istring &s) const {
      ::etl::to_string(value, s);
    }
  };

  template<class T>
  struct is_etl_string : std::is_base_of<::etl::istring, T> {};

  template<class T>
  struct is_c_string : std::bool_constant<
    std::is_pointer_v<T> && std::is_same_v<std::remove_const_t<std::remove_pointer_t<T>>, char>
  > {};

  namespace detail {
    inline bool at_placeholder(const char *format) {
      return format[0] == '{' && format[1] == '}';
    }

    /**
     * writes one argument into s, which spans the room left in the output buffer.
     */
    template<class T>
    void format_arg(const T &value, ::etl::istring &s) {
      using Decay = std::decay_t<T>;
      if constexpr (is_c_string<Decay>::value || is_etl_string<Decay>::value) {
        // etl::to_string prints pointers as numbers and has no overload for etl strings
        s.assign(value);
      } else {
        to_stringer<Decay>{}(value, s);
      }
    }

    // no arguments left: the rest of the format is copied as is, placeholders included
    inline char *format_into(char *dest, char *last, const char *format) {
      while (*format && dest != last) {
        *dest++ = *format++;
      }
      return dest;
    }

    /**
     * `last` is where the terminating \0 goes once everything is written.
     */
    template<class Arg0, class ...Args>
    char *format_into(char *dest, char *last, const char *format, const Arg0 &a0, const Args &...args) {
      while (*format && dest != last && !at_placeholder(format)) {
        *dest++ = *format++;
      }
      if (!*format || dest == last) {
        return dest;
      }
      ::etl::string_ext s {dest, static_cast<size_t>(last - dest) + 1};
      format_arg(a0, s);
      return format_into(dest + s.length(), last, format + 2, args...);
    }
  }

  /**
   * formats into dest, replacing each {} with the next argument. output is truncated to
   * destlen - 1 chars and always terminated. returns the length written excluding \0.
   */
  template<class ...Args>
  inline size_t snformat(char *dest, size_t destlen, const char *format, const Args &...args) {
    auto *end = detail::format_into(dest, dest + destlen - 1, format, args...);
    *end = '\0';
    return static_cast<size_t>(end - dest);
  }

  template<size_t N, class ...Args>
  inline size_t snformat(char (&dest)[N], const char *format, const Args &...args) {
    static_assert(N);
    return snformat(dest, N, format, args...);
  }

  /**
   * formats into an existing etl string, replacing its content.
   */
  template<class ...Args>
  inline size_t sformat(::etl::istring &dest, const char *format, const Args &...args) {
    auto sz = snformat(dest.data(), dest.capacity() + 1, format, args...);
    dest.uninitialized_resize(sz);
    return sz;
  }

  template<size_t N, class ...Args>
  inline ::etl::string<N> sformat(const char *format, const Args &...args) {
    ::etl::string<N> buf;
    sformat(buf, format, args...);
    return buf;
  }

}  // namespace yard
