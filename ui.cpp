#include <cstdio>
#include "ui.hpp"

namespace ui {

ui_sender &out() {
  static ui_sender sender;
  return sender;
}

const char *manual[] = {
  "Manual",
  "switchyard_sim [--from east|west] [--seconds N] [--switch N|R] <order>...",
  "",
  "  --from east|west     portal the train enters through (default east)",
  "  --seconds N          simulated time limit (default 600)",
  "  --switch N|R         position of switch main at spawn (default N)",
  "  without orders the train runs through and leaves the layout",
  "",
  "Orders",
  "  mv <spot>            Move to Platform, Team Track, East Tunnel or West Tunnel",
  "  rv F|R               Set reverser",
  "  sw <switch> N|R      Throw a switch",
  "  wt <seconds>         Wait",
  "  cp                   Couple",
  "  uc <cars>            Uncouple",
};

void ui_sender::post(char const *str) {
  // a full buffer drops its oldest notice
  board.push(notice_t(str));
  if (echo) {
    std::printf("%s\n", str);
  }
}

etl::string<8> stringify_clock(int seconds) {
  seconds %= 24 * 3600;
  if (seconds < 0) {
    seconds += 24 * 3600;
  }
  auto h = seconds / 3600, m = seconds / 60 % 60, s = seconds % 60;
  return yard::sformat<8>("{}{}:{}{}:{}{}", h / 10, h % 10, m / 10, m % 10, s / 10, s % 10);
}

void print_manual() {
  for (auto line : manual) {
    std::printf("%s\n", line);
  }
}

}
