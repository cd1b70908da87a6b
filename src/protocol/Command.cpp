#include "protocol/Command.hpp"
#include <iomanip>

namespace payload_hal {
namespace protocol {

std::vector<uint8_t> Command::serialize() const {
    std::vector<uint8_t> data;
    data.reserve(1 + payload.size());
    data.push_back(opcode);
    data.insert(data.end(), payload.begin(), payload.end());
    return data;
}

std::ostream& operator<<(std::ostream& os, const Command& command) {
    const auto flags = os.flags();
    os << "cmd 0x" << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(command.opcode) << " [";
    for (size_t i = 0; i < command.payload.size(); ++i) {
        if (i > 0) os << " ";
        os << std::setw(2) << std::setfill('0') << static_cast<int>(command.payload[i]);
    }
    os << "]";
    os.flags(flags);
    return os;
}

} // namespace protocol
} // namespace payload_hal
