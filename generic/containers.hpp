#pragma once

#include <cstddef>
#include <etl/unordered_map.h>
#include <etl/string.h>

namespace yard {

  namespace etl {
    // etl::hash<etl::string(|_view|_ext)> is not good here
    // source: https://stackoverflow.com/questions/16075271/hashing-a-string-to-an-integer-in-c
    struct string_hash {
      template<class T>
      size_t operator()(const T& text) const {
        size_t hash = 5381, size = text.size();
        for (size_t i = 0; i < size; ++i)
          hash = 33 * hash + (size_t)text[i];
        return hash;
      }
    };
  }

  /**
   * fixed capacity map keyed by short names (switch names, spot names...).
   */
  template<class V, size_t MaxKeySize, size_t MaxSize>
  using string_map = ::etl::unordered_map<::etl::string<MaxKeySize>, V, MaxSize, MaxSize, etl::string_hash>;

}  // namespace yard
