#pragma once

#include <string>

namespace TXR {
namespace Normalize {

// EN: Small ASCII helpers shared by the field normalizers
// FR: Petits utilitaires ASCII partagés par les normaliseurs de champs
std::string trim(const std::string& text);
std::string toUpperAscii(const std::string& text);
std::string toLowerAscii(const std::string& text);

} // namespace Normalize
} // namespace TXR
