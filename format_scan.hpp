#pragma once

#include <cstddef>
#include <etl/string.h>

namespace yard {

  namespace detail {
    inline bool scan_one(const char *&src, const char *end, char, int &out) {
      auto *p = src;
      auto negative = p != end && *p == '-';
      if (negative) {
        ++p;
      }
      int value = 0, digits = 0;
      for (; p != end && '0' <= *p && *p <= '9'; ++p, ++digits) {
        if (digits == 9) {
          return false;
        }
        value = value * 10 + (*p - '0');
      }
      if (!digits) {
        return false;
      }
      out = negative ? -value : value;
      src = p;
      return true;
    }

    inline bool scan_one(const char *&src, const char *end, char, char &out) {
      if (src == end) {
        return false;
      }
      out = *src++;
      return true;
    }

    // reads up to the literal that follows the placeholder, or to the end of input
    inline bool scan_one(const char *&src, const char *end, char stop, ::etl::istring &out) {
      auto *p = src;
      while (p != end && (stop == '\0' || *p != stop)) {
        ++p;
      }
      if (p == src || static_cast<size_t>(p - src) > out.capacity()) {
        return false;
      }
      out.assign(src, p);
      src = p;
      return true;
    }
  }  // namespace detail

  inline bool sscan_impl(const char *src, const char *end, const char *format) {
    for (; *format; ++format, ++src) {
      if (src == end || *src != *format) {
        return false;
      }
    }
    return src == end;
  }

  template<class Arg0, class ...Args>
  inline bool sscan_impl(const char *src, const char *end, const char *format, Arg0 &a0, Args &...args) {
    for (; *format; ++format, ++src) {
      if (*format == '{' && *(format + 1) == '}') {
        if (!detail::scan_one(src, end, *(format + 2), a0)) {
          return false;
        }
        return sscan_impl(src, end, format + 2, args...);
      }
      if (src == end || *src != *format) {
        return false;
      }
    }
    // more arguments than placeholders
    return false;
  }

  /**
   * the reverse of snformat: matches src against format, filling one argument per {}.
   * accepts int, char and etl strings. true only if the whole input matched.
   *
   * arguments may be written to even if matching fails later.
   */
  template<class ...Args>
  inline bool sscan(const char *src, size_t srclen, const char *format, Args &...args) {
    return sscan_impl(src, src + srclen, format, args...);
  }

}  // namespace yard
