#pragma once

#include <etl/optional.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>
#include "track_geometry.hpp"

namespace tracks {
  using element_id = int;

  constexpr size_t max_elements = 64;
  constexpr size_t max_connections = 128;
  constexpr size_t max_switch_name_len = 8;

  using switch_name_t = etl::string<max_switch_name_len>;

  /**
   * one side of a connection: connector `index` of element `element`.
   */
  struct connector_ref {
    element_id element {};
    size_t index {};

    bool operator==(const connector_ref &other) const {
      return element == other.element && index == other.index;
    }
  };

  struct placed_element {
    element_id id {};
    element_type type {};
    // derived from connector 0, never edited on their own
    connector_set_t connectors {};
    // turnouts only: name of the switch that throws this turnout
    switch_name_t switch_name {};
  };

  struct connection {
    connector_ref from {}, to {};
  };

  /**
   * track elements placed on the plane and the connections between their connectors.
   *
   * built once, then only read. joined connectors are expected to line up (see are_joined);
   * the layout does not check it.
   */
  class layout {
  public:
    /**
     * appends an element whose connectors derive from c0. empty if the layout is full.
     */
    etl::optional<element_id> place_element(const element_type &type, const connector &c0);

    /**
     * appends an element whose connector 0 mirrors the target connector, and connects the two.
     * empty if the target does not exist or the layout is full.
     */
    etl::optional<element_id> place_element_at(const element_type &type, connector_ref target);

    /**
     * records an edge between two existing connectors.
     */
    bool connect(connector_ref a, connector_ref b);

    /**
     * names the switch controlling a turnout.
     */
    bool name_switch(element_id id, etl::string_view name);

    const placed_element *find_element(element_id id) const;
    etl::optional<connector> get_connector(connector_ref ref) const;

    /**
     * the connector on the other side of ref, looking at connections in both directions.
     */
    etl::optional<connector_ref> find_connected(connector_ref ref) const;

    const etl::vector<placed_element, max_elements> &elements() const {
      return elements_;
    }

    const etl::vector<connection, max_connections> &connections() const {
      return connections_;
    }

  private:
    etl::vector<placed_element, max_elements> elements_ {};
    etl::vector<connection, max_connections> connections_ {};
    element_id next_id_ {};
  };
}
