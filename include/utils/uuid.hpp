#pragma once

#include <string>

namespace cmm {

// Random version-4 UUID, used for wallet transactions and trade ids
std::string generate_uuid();

} // namespace cmm
