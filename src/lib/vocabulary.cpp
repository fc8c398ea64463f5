#include <bpg/vocabulary.hpp>

#include <array>
#include <type_traits>
#include <utility>

namespace bpg {

  namespace {

    struct element_entry {
      std::string_view name;
      node_kind kind;
      std::string_view label;
    };

    // Decode dispatch table: every process child that becomes a node.
    const std::array<element_entry, 28>&
    element_table() {
      static const std::array<element_entry, 28> table{{
          {"startEvent", start_event{}, "Start"},
          {"endEvent", end_event{}, "End"},
          {"intermediateCatchEvent",
           intermediate_event{event_direction::catching}, "Intermediate Event"},
          {"intermediateThrowEvent",
           intermediate_event{event_direction::throwing}, "Intermediate Event"},
          {"boundaryEvent", boundary_event{}, "Boundary Event"},
          {"task", task{task_kind::plain}, "Task"},
          {"serviceTask", task{task_kind::service}, "Service Task"},
          {"userTask", task{task_kind::user}, "User Task"},
          {"scriptTask", task{task_kind::script}, "Script Task"},
          {"businessRuleTask", task{task_kind::business_rule},
           "Business Rule Task"},
          {"sendTask", task{task_kind::send}, "Send Task"},
          {"receiveTask", task{task_kind::receive}, "Receive Task"},
          {"manualTask", task{task_kind::manual}, "Manual Task"},
          {"exclusiveGateway", gateway{gateway_kind::exclusive},
           "Exclusive Gateway"},
          {"inclusiveGateway", gateway{gateway_kind::inclusive},
           "Inclusive Gateway"},
          {"parallelGateway", gateway{gateway_kind::parallel},
           "Parallel Gateway"},
          {"eventBasedGateway", gateway{gateway_kind::event_based},
           "Event Gateway"},
          {"complexGateway", gateway{gateway_kind::complex}, "Complex Gateway"},
          {"subProcess", sub_process{}, "Sub Process"},
          {"callActivity", call_activity{}, "Call Activity"},
          {"dataObject", data_object{false}, "Data Object"},
          {"dataObjectReference", data_object{true}, "Data Object"},
          {"dataStore", data_store{false}, "Data Store"},
          {"dataStoreReference", data_store{true}, "Data Store"},
          {"group", group{}, "Group"},
          {"textAnnotation", text_annotation{}, "Annotation"},
          {"participant", participant{}, "Participant"},
          {"lane", lane{}, "Lane"},
      }};
      return table;
    }

    // Participants and lanes come from the collaboration and lane sets, not
    // from the process body.
    bool
    decodes_from_process(const node_kind& kind) {
      return !std::holds_alternative<participant>(kind) &&
             !std::holds_alternative<lane>(kind);
    }

    const element_entry*
    entry_for(const node_kind& kind) {
      for (const auto& entry : element_table()) {
        if (entry.kind.index() != kind.index()) { continue; }
        bool match = std::visit(
            [&entry](const auto& k) {
              using T = std::decay_t<decltype(k)>;
              const auto& other = std::get<T>(entry.kind);
              if constexpr (std::is_same_v<T, participant>) {
                return true;
              } else {
                return other == k;
              }
            },
            kind);
        if (match) { return &entry; }
      }
      return nullptr;
    }

  } // namespace

  bool
  is_model_element(const qname& name, std::string_view local_name) {
    return name.local_name == local_name &&
           (name.namespace_uri == ns::model || name.namespace_uri.empty());
  }

  bool
  is_element_in(const qname& name, const std::string& namespace_uri,
                std::string_view local_name) {
    return name.local_name == local_name &&
           (name.namespace_uri == namespace_uri ||
            name.namespace_uri.empty());
  }

  std::string_view
  element_name(const node_kind& kind) {
    const auto* entry = entry_for(kind);
    return entry != nullptr ? entry->name : std::string_view("task");
  }

  std::optional<node_kind>
  kind_for_element(std::string_view local_name) {
    for (const auto& entry : element_table()) {
      if (entry.name == local_name && decodes_from_process(entry.kind)) {
        return entry.kind;
      }
    }
    return std::nullopt;
  }

  const std::vector<std::string_view>&
  process_node_names() {
    static const std::vector<std::string_view> names = [] {
      std::vector<std::string_view> result;
      for (const auto& entry : element_table()) {
        if (decodes_from_process(entry.kind)) { result.push_back(entry.name); }
      }
      return result;
    }();
    return names;
  }

  bool
  same_family(const node_kind& a, const node_kind& b) {
    return a.index() == b.index();
  }

  bool
  is_flow_node(const node_kind& kind) {
    return std::visit(
        [](const auto& k) {
          using T = std::decay_t<decltype(k)>;
          if constexpr (std::is_same_v<T, start_event> ||
                        std::is_same_v<T, end_event> ||
                        std::is_same_v<T, intermediate_event> ||
                        std::is_same_v<T, boundary_event> ||
                        std::is_same_v<T, task> ||
                        std::is_same_v<T, gateway> ||
                        std::is_same_v<T, sub_process> ||
                        std::is_same_v<T, call_activity>) {
            return true;
          } else if constexpr (std::is_same_v<T, data_object> ||
                               std::is_same_v<T, data_store> ||
                               std::is_same_v<T, group> ||
                               std::is_same_v<T, text_annotation> ||
                               std::is_same_v<T, participant> ||
                               std::is_same_v<T, lane>) {
            return false;
          } else {
            static_assert(always_false_v<T>, "unhandled node kind");
          }
        },
        kind);
  }

  std::string_view
  default_label(const node_kind& kind) {
    const auto* entry = entry_for(kind);
    return entry != nullptr ? entry->label : std::string_view("Element");
  }

} // namespace bpg
