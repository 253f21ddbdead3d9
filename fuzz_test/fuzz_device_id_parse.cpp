#include <core/device_id.hpp>
#include <core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

// Fuzzer that feeds arbitrary bytes to the device ID parser
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string_view input(reinterpret_cast<const char *>(Data), Size);

  try {
    const auto id = devid::core::device_id::parse(input);
    if (devid::core::device_id::parse(id.to_string()) != id) { throw std::logic_error("round trip mismatch"); }
  } catch (const devid::core::bad_format_error &) {
    return 0;
  }

  return 0;
}
