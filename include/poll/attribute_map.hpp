#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/record.hpp"

namespace dl100_bridge::poll {

// CIP attribute address plus its data type, e.g. {"@0x23/1/10", "DINT"}.
struct AttributeId {
  std::string path;
  std::string type;

  friend bool operator==(const AttributeId&, const AttributeId&) = default;
};

struct AttributeBinding {
  AttributeId id;
  model::Channel channel;
};

// Distance (class 0x23, attribute 10) and velocity (attribute 24) of the DL100.
const std::vector<AttributeBinding>& dl100_attribute_bindings();

std::vector<AttributeId> dl100_attributes();

std::optional<model::Channel> channel_for(const AttributeId& attribute);

std::string to_string(const AttributeId& attribute);

}  // namespace dl100_bridge::poll
