#include "track_layout.hpp"

namespace tracks {
  etl::optional<element_id> layout::place_element(const element_type &type, const connector &c0) {
    if (elements_.full()) {
      return {};
    }
    auto id = next_id_++;
    elements_.push_back({id, type, compute_connectors(c0, type), {}});
    return id;
  }

  etl::optional<element_id> layout::place_element_at(const element_type &type, connector_ref target) {
    auto anchor = get_connector(target);
    if (!anchor || connections_.full()) {
      return {};
    }
    connector c0 {anchor->position, normalize_angle(anchor->orientation + fp::pi())};
    auto id = place_element(type, c0);
    if (!id) {
      return {};
    }
    connections_.push_back({target, {*id, 0}});
    return id;
  }

  bool layout::connect(connector_ref a, connector_ref b) {
    if (!get_connector(a) || !get_connector(b) || connections_.full()) {
      return false;
    }
    connections_.push_back({a, b});
    return true;
  }

  bool layout::name_switch(element_id id, etl::string_view name) {
    for (auto &element : elements_) {
      if (element.id == id) {
        if (element.type.kind != element_kind::TURNOUT || name.size() > max_switch_name_len) {
          return false;
        }
        element.switch_name.assign(name.begin(), name.end());
        return true;
      }
    }
    return false;
  }

  const placed_element *layout::find_element(element_id id) const {
    for (auto &element : elements_) {
      if (element.id == id) {
        return &element;
      }
    }
    return nullptr;
  }

  etl::optional<connector> layout::get_connector(connector_ref ref) const {
    auto *element = find_element(ref.element);
    if (!element || ref.index >= element->connectors.size()) {
      return {};
    }
    return element->connectors[ref.index];
  }

  etl::optional<connector_ref> layout::find_connected(connector_ref ref) const {
    for (auto &conn : connections_) {
      if (conn.from == ref) {
        return conn.to;
      }
      if (conn.to == ref) {
        return conn.from;
      }
    }
    return {};
  }
}
