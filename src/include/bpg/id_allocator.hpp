#pragma once

#include <bpg/model.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>

namespace bpg {

  // Issues element ids. One allocator per editing session; the decoder feeds
  // it every imported id so nothing it generates afterwards can collide.
  class id_allocator {
    std::mt19937 engine_;
    std::uint64_t counter_ = 1;
    std::unordered_set<std::string> taken_;

  public:
    id_allocator();

    // Deterministic sequence, for tests.
    explicit id_allocator(std::uint32_t seed);

    // "<CanonicalTypeName>_<6 uppercase hex digits>", e.g.
    // "ExclusiveGateway_0A1B2C".
    std::string
    generate_id(std::string_view element_name);

    std::string
    generate_id(const node_kind& kind);

    // "<prefix>_<n>" from the sequential counter.
    std::string
    legacy_id(std::string_view prefix);

    // Moves the sequential counter past max_observed_suffix; never backwards.
    void
    reseed(std::uint64_t max_observed_suffix);

    // Records an id that exists in the document.
    void
    observe(const std::string& id);

    bool
    is_taken(const std::string& id) const {
      return taken_.count(id) != 0;
    }

    std::uint64_t
    counter() const {
      return counter_;
    }
  };

  // Canonical type name for a BPMN element local name; "Element" when unknown.
  std::string_view
  canonical_type_name(std::string_view element_name);

  // Value of the all-digit tail after the last '_' ("Task_12" -> 12), or of
  // the whole id when it is all digits.
  std::optional<std::uint64_t>
  numeric_suffix(std::string_view id);

} // namespace bpg
