#include "harness/TestData.hpp"

namespace payload_hal {
namespace harness {

std::vector<uint8_t> createTestData(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i & 0xFF);
    }
    return data;
}

bool verifyTestData(const std::vector<uint8_t>& data) {
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i] != static_cast<uint8_t>(i & 0xFF)) {
            return false;
        }
    }
    return true;
}

} // namespace harness
} // namespace payload_hal
