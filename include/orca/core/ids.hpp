#pragma once

#include <string>

namespace orca {

// Random (version 4) UUID in canonical text form
std::string new_uuid();

// Name-based (version 5) UUID: the same name always yields the same id
std::string uuid_from_name(const std::string& name);

bool is_uuid(const std::string& text);

} // namespace orca
