#pragma once

#include <fpm/fixed.hpp>
#include "../format.hpp"

/**
 * prints fixed point numbers with two decimals, rounded half away from zero.
 */
template<class B, class I, unsigned int F, bool R>
struct yard::to_stringer<fpm::fixed<B, I, F, R>> {
  void operator()(const fpm::fixed<B, I, F, R> f, ::etl::istring &s) const {
    long long raw = f.raw_value();
    auto negative = raw < 0;
    if (negative) {
      raw = -raw;
    }
    auto cents = (raw * 100 + (1LL << (F - 1))) >> F;
    sformat(
      s,
      "{}{}.{}{}",
      negative && cents != 0 ? "-" : "",
      static_cast<int>(cents / 100),
      static_cast<int>(cents / 10 % 10),
      static_cast<int>(cents % 10)
    );
  }
};
