#pragma once

#include <boost/uuid/uuid.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace weblib {

using Uuid = boost::uuids::uuid;

// Random (version 4) UUID
Uuid newUuid4();

// Canonical 8-4-4-4-12 text only; nullopt for anything else
std::optional<Uuid> parseUuid(std::string_view text);

std::string toString(const Uuid &uuid);

} // namespace weblib
