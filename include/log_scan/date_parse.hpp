#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace lscan {

// ISO-8601 subset -> epoch millis:
//   YYYY-MM-DD[(T| )HH:MM[:SS[.fff...]]][Z|+HH:MM|-HH:MM|+HHMM|-HHMM]
// No offset means UTC. Fractions beyond millis are truncated.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

}
