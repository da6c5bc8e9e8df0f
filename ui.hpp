#pragma once

#include <etl/circular_buffer.h>
#include <etl/string.h>
#include "generic/format.hpp"

namespace ui {

constexpr size_t notice_len = 128;
constexpr size_t num_notices = 10;

using notice_t = etl::string<notice_len>;
using notices_t = etl::circular_buffer<notice_t, num_notices>;

/**
 * keeps the most recent notices, oldest first, and optionally echoes each one to stdout.
 */
struct ui_sender {
  template<size_t N>
  void send_notice(etl::string<N> const &str) {
    post(str.c_str());
  }

  template<size_t N>
  void send_notice(char const (&str)[N]) {
    post(str);
  }

  void set_echo(bool echo) {
    this->echo = echo;
  }

  notices_t const &notices() const {
    return board;
  }

  void clear() {
    board.clear();
  }

private:
  void post(char const *str);

  notices_t board {};
  bool echo {};
};

/**
 * global notice board shared by the traffic controller and the simulator.
 */
ui_sender &out();

/**
 * seconds since midnight as HH:MM:SS, wrapping at 24h.
 */
etl::string<8> stringify_clock(int seconds);

/**
 * command reference printed by the simulator.
 */
void print_manual();

}
