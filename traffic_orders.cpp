#include "format_scan.hpp"
#include "generic/format.hpp"
#include "traffic.hpp"

namespace {
  using namespace traffic;

  char upper(char c) {
    return ('a' <= c && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
  }
}  // namespace

namespace traffic {
  fp consist_length(const consist_t &consist) {
    fp total {};
    for (auto kind : consist) {
      total += tracks::car_length(kind);
    }
    return total;
  }

  order_text_t describe_order(const order &o) {
    switch (o.kind) {
      case order_kind::MOVE_TO:
        return yard::sformat<order_text_t::MAX_SIZE>("Move To {}", tracks::spot_name(o.spot));
      case order_kind::SET_REVERSER:
        return yard::sformat<order_text_t::MAX_SIZE>("Set Reverser {}", stringify_reverser(o.reverser));
      case order_kind::SET_SWITCH:
        return yard::sformat<order_text_t::MAX_SIZE>("Set {} {}", o.switch_name, tracks::stringify_switch_position(o.position));
      case order_kind::WAIT_SECONDS:
        return yard::sformat<order_text_t::MAX_SIZE>("Wait {} seconds", static_cast<int>(o.seconds));
      case order_kind::COUPLE:
        return order_text_t("Couple");
      case order_kind::UNCOUPLE:
        return yard::sformat<order_text_t::MAX_SIZE>("Uncouple {} {}", o.cars, o.cars == 1 ? "car" : "cars");
    }
    return order_text_t("?");
  }

  etl::optional<order> parse_order(etl::string_view text) {
    auto *s = text.data();
    auto len = text.size();
    int n = 0;
    char c = 0;
    etl::string<16> spot;
    tracks::switch_name_t name;

    if (yard::sscan(s, len, "mv {}", spot)) {
      auto parsed = tracks::parse_spot(etl::string_view(spot.data(), spot.size()));
      if (parsed) {
        return order::move_to(*parsed);
      }
    } else if (yard::sscan(s, len, "rv {}", c)) {
      c = upper(c);
      if (c == 'F' || c == 'R') {
        return order::set_reverser(c == 'F' ? reverser_t::FORWARD : reverser_t::REVERSE);
      }
    } else if (yard::sscan(s, len, "sw {} {}", name, c)) {
      c = upper(c);
      if (c == 'N' || c == 'R') {
        return order::set_switch(etl::string_view(name.data(), name.size()), c == 'N' ? tracks::switch_position::NORMAL : tracks::switch_position::REVERSE);
      }
    } else if (yard::sscan(s, len, "wt {}", n)) {
      if (n >= 0 && n <= max_wait_seconds) {
        return order::wait_seconds(fp{n});
      }
    } else if (yard::sscan(s, len, "cp")) {
      return order::couple();
    } else if (yard::sscan(s, len, "uc {}", n)) {
      if (n >= 1 && n < static_cast<int>(max_cars)) {
        return order::uncouple(n);
      }
    }
    return {};
  }

  const char *stringify_train_state(train_state state) {
    switch (state) {
      case train_state::EXECUTING:
        return "executing";
      case train_state::WAITING_FOR_ORDERS:
        return "waiting for orders";
      case train_state::STOPPED:
        return "stopped";
    }
    return "?";
  }

  const char *stringify_reverser(reverser_t reverser) {
    return reverser == reverser_t::FORWARD ? "Forward" : "Reverse";
  }
}
