#include <bpg/id_allocator.hpp>
#include <bpg/vocabulary.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <utility>

namespace bpg {

  namespace {

    constexpr std::array<std::pair<std::string_view, std::string_view>, 36>
        type_names{{
            {"startEvent", "StartEvent"},
            {"endEvent", "EndEvent"},
            {"intermediateCatchEvent", "IntermediateCatchEvent"},
            {"intermediateThrowEvent", "IntermediateThrowEvent"},
            {"boundaryEvent", "BoundaryEvent"},
            {"task", "Task"},
            {"serviceTask", "ServiceTask"},
            {"userTask", "UserTask"},
            {"scriptTask", "ScriptTask"},
            {"businessRuleTask", "BusinessRuleTask"},
            {"sendTask", "SendTask"},
            {"receiveTask", "ReceiveTask"},
            {"manualTask", "ManualTask"},
            {"subProcess", "SubProcess"},
            {"callActivity", "CallActivity"},
            {"exclusiveGateway", "ExclusiveGateway"},
            {"inclusiveGateway", "InclusiveGateway"},
            {"parallelGateway", "ParallelGateway"},
            {"eventBasedGateway", "EventBasedGateway"},
            {"complexGateway", "ComplexGateway"},
            {"dataObject", "DataObject"},
            {"dataObjectReference", "DataObjectReference"},
            {"dataStore", "DataStore"},
            {"dataStoreReference", "DataStoreReference"},
            {"group", "Group"},
            {"textAnnotation", "TextAnnotation"},
            {"participant", "Participant"},
            {"lane", "Lane"},
            {"laneSet", "LaneSet"},
            {"process", "Process"},
            {"collaboration", "Collaboration"},
            {"sequenceFlow", "SequenceFlow"},
            {"messageFlow", "MessageFlow"},
            {"BPMNShape", "BPMNShape"},
            {"BPMNEdge", "BPMNEdge"},
            {"BPMNDiagram", "BPMNDiagram"},
        }};

  } // namespace

  std::string_view
  canonical_type_name(std::string_view element_name) {
    auto it = std::find_if(
        type_names.begin(), type_names.end(),
        [element_name](const auto& entry) { return entry.first == element_name; });
    return it != type_names.end() ? it->second : std::string_view("Element");
  }

  std::optional<std::uint64_t>
  numeric_suffix(std::string_view id) {
    auto pos = id.rfind('_');
    auto tail = pos == std::string_view::npos ? id : id.substr(pos + 1);
    if (tail.empty() || tail.size() > 19) { return std::nullopt; }
    std::uint64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(tail.data(), tail.data() + tail.size(), value);
    if (ec != std::errc() || ptr != tail.data() + tail.size()) {
      return std::nullopt;
    }
    return value;
  }

  id_allocator::id_allocator() : engine_(std::random_device{}()) {}

  id_allocator::id_allocator(std::uint32_t seed) : engine_(seed) {}

  std::string
  id_allocator::generate_id(std::string_view element_name) {
    std::uniform_int_distribution<unsigned> hex(0, 0xFFFFFF);
    std::string prefix(canonical_type_name(element_name));
    for (;;) {
      char digits[8];
      std::snprintf(digits, sizeof digits, "%06X", hex(engine_));
      std::string id = prefix + '_' + digits;
      if (taken_.insert(id).second) { return id; }
    }
  }

  std::string
  id_allocator::generate_id(const node_kind& kind) {
    return generate_id(element_name(kind));
  }

  std::string
  id_allocator::legacy_id(std::string_view prefix) {
    for (;;) {
      std::string id = std::string(prefix) + '_' + std::to_string(counter_++);
      if (taken_.insert(id).second) { return id; }
    }
  }

  void
  id_allocator::reseed(std::uint64_t max_observed_suffix) {
    counter_ = std::max(counter_, max_observed_suffix + 1);
  }

  void
  id_allocator::observe(const std::string& id) {
    taken_.insert(id);
  }

} // namespace bpg
