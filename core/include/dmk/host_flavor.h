#pragma once

#include <string>
#include <string_view>

namespace dmk {

enum class HostFlavor {
  Writer,        // word processor
  Spreadsheet,
  Presentation,
  Unknown
};

const char* host_flavor_name(HostFlavor flavor);

// Accepts "writer"/"wps", "spreadsheet"/"et", "presentation"/"wpp".
HostFlavor parse_host_flavor(std::string_view name);

} // namespace dmk
