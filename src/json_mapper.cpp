#include "json_mapper.hpp"
#include "string_utils.hpp"

namespace weblib {

std::string JsonMapper::write(const nlohmann::json &value) const {
  const auto &out = camelCase_ ? toCamelCase(value) : value;
  return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json JsonMapper::read(std::string_view text) const {
  auto json = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (json.is_discarded()) {
    throw ValidationException("body", "is not valid JSON",
                              ErrorCode::INVALID_FORMAT);
  }
  return camelCase_ ? toSnakeCase(json) : json;
}

void JsonMapper::keepKeysOf(std::string property) {
  mapProperties_.insert(std::move(property));
}

bool JsonMapper::keepsKeysOf(std::string_view property) const {
  return mapProperties_.find(property) != mapProperties_.end();
}

nlohmann::json JsonMapper::toCamelCase(const nlohmann::json &value) const {
  return convertKeys(value, true);
}

nlohmann::json JsonMapper::toSnakeCase(const nlohmann::json &value) const {
  return convertKeys(value, false);
}

nlohmann::json JsonMapper::convertKeys(const nlohmann::json &value,
                                       bool toCamel) const {
  if (value.is_array()) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto &item : value) {
      result.push_back(convertKeys(item, toCamel));
    }
    return result;
  }
  if (!value.is_object()) {
    return value;
  }

  nlohmann::json result = nlohmann::json::object();
  for (auto it = value.begin(); it != value.end(); ++it) {
    auto snakeName = toCamel ? it.key() : string_utils::camel_to_snake(it.key());
    auto name = toCamel ? string_utils::snake_to_camel(it.key()) : snakeName;

    const auto &child = it.value();
    if (child.is_object() && keepsKeysOf(snakeName)) {
      nlohmann::json entries = nlohmann::json::object();
      for (auto entry = child.begin(); entry != child.end(); ++entry) {
        entries[entry.key()] = convertKeys(entry.value(), toCamel);
      }
      result[name] = std::move(entries);
    } else {
      result[name] = convertKeys(child, toCamel);
    }
  }
  return result;
}

} // namespace weblib
