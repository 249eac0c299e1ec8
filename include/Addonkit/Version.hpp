// =================================================================
// include/Addonkit/Version.hpp
// =================================================================

#pragma once

namespace Addonkit {

constexpr const char* kToolName = "addonkit";
constexpr const char* kToolVersion = "1.0.0";

} // namespace Addonkit
