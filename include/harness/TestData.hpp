#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace payload_hal {
namespace harness {

/**
 * @brief Counting pattern 0, 1, 2, ... (wrapping at 256)
 */
std::vector<uint8_t> createTestData(size_t size);

/**
 * @brief True if data holds the createTestData() pattern
 */
bool verifyTestData(const std::vector<uint8_t>& data);

} // namespace harness
} // namespace payload_hal
