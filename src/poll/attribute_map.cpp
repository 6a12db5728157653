#include "poll/attribute_map.hpp"

namespace dl100_bridge::poll {

const std::vector<AttributeBinding>& dl100_attribute_bindings() {
  static const std::vector<AttributeBinding> kBindings = {
      {{"@0x23/1/10", "DINT"}, model::Channel::DISTANCE},
      {{"@0x23/1/24", "DINT"}, model::Channel::VELOCITY},
  };
  return kBindings;
}

std::vector<AttributeId> dl100_attributes() {
  std::vector<AttributeId> attributes;
  for (const auto& binding : dl100_attribute_bindings()) {
    attributes.push_back(binding.id);
  }
  return attributes;
}

std::optional<model::Channel> channel_for(const AttributeId& attribute) {
  for (const auto& binding : dl100_attribute_bindings()) {
    if (binding.id == attribute) {
      return binding.channel;
    }
  }
  return std::nullopt;
}

std::string to_string(const AttributeId& attribute) {
  return attribute.path + "(" + attribute.type + ")";
}

}  // namespace dl100_bridge::poll
