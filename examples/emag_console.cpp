#include "driver/EmagDevice.hpp"
#include "protocol/EmagProtocol.hpp"
#include "transport/I2CTransport.hpp"
#include "transport/MockTransports.hpp"
#include "utils/Logger.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace payload_hal;

namespace {

/**
 * @brief Mock EMAG answering one status/charge/actuate/wipe sequence
 */
std::shared_ptr<transport::MockI2CTransport> createScriptedEmag() {
    auto mock = std::make_shared<transport::MockI2CTransport>();

    protocol::SystemStatus telemetry;
    telemetry.sys_current = 0.125f;
    telemetry.x_hall = 1.5f;
    telemetry.y_hall = -0.75f;
    telemetry.z_hall = 0.0f;
    telemetry.cap_volt = 11.8f;

    mock->expectTransfer()
        .withTx({0x01, 0x00})
        .withRxLength(protocol::EmagProtocol::SYSTEM_STATUS_REPLY_LENGTH)
        .returns(protocol::EmagProtocol::encodeSystemStatus(telemetry));
    mock->expectTransfer()
        .withTx({0x02, 80})
        .withRxLength(2)
        .returns({0x00, 80});
    mock->expectTransfer()
        .withTx({0x03, protocol::encodeAxis(protocol::Axis::Z_PLUS)})
        .returns({0x01});
    mock->expectTransfer()
        .withTx({0x04, protocol::encodeAxis(protocol::Axis::Z_PLUS)})
        .returns({0x01});

    return mock;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--hardware BUS ADDRESS]" << std::endl;
    std::cout << "  Without --hardware the sequence runs against a scripted mock." << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    utils::Logger::getInstance().configureFromEnvironment();

    std::shared_ptr<transport::IBidirectional> bus;
    std::shared_ptr<transport::MockI2CTransport> mock;

    if (argc == 4 && std::string(argv[1]) == "--hardware") {
        transport::I2CTransport::Config config;
        config.bus_number = static_cast<uint8_t>(std::strtoul(argv[2], nullptr, 0));
        config.device_address = static_cast<uint16_t>(std::strtoul(argv[3], nullptr, 0));
        bus = std::make_shared<transport::I2CTransport>(config);
        std::cout << "Using " << transport::I2CTransport::describe(config) << std::endl;
    } else if (argc == 1) {
        mock = createScriptedEmag();
        bus = mock;
        std::cout << "Using scripted mock EMAG" << std::endl;
    } else {
        printUsage(argv[0]);
        return 1;
    }

    driver::EmagDevice emag(bus);
    emag.setErrorCallback([](const transport::HardwareError& error, const std::string& context) {
        std::cerr << "  ✗ " << context << ": " << error << std::endl;
    });

    if (!emag.initialize()) {
        return 1;
    }

    std::cout << std::endl << "=== System Status ===" << std::endl;
    auto status = emag.getSystemStatus();
    if (status) {
        const auto& sys = status.value();
        std::cout << "  Current:     " << sys.sys_current << " A" << std::endl;
        std::cout << "  Hall X/Y/Z:  " << sys.x_hall << " / " << sys.y_hall << " / "
                  << sys.z_hall << std::endl;
        std::cout << "  Capacitor:   " << sys.cap_volt << " V" << std::endl;
    }

    std::cout << std::endl << "=== Charge ===" << std::endl;
    auto charge = emag.setChargeVoltage(80);
    if (charge) {
        std::cout << "  ✓ Device reports " << charge.value() << std::endl;
    }

    std::cout << std::endl << "=== Actuation ===" << std::endl;
    if (emag.actuate(protocol::Axis::Z_PLUS)) {
        std::cout << "  ✓ Actuated " << protocol::Axis::Z_PLUS << std::endl;
    }
    if (emag.wipe(protocol::Axis::Z_PLUS)) {
        std::cout << "  ✓ Wiped " << protocol::Axis::Z_PLUS << std::endl;
    }

    if (!emag.deinitialize()) {
        return 1;
    }

    auto interface_status = emag.getStatus();
    std::cout << std::endl << "=== Interface ===" << std::endl;
    std::cout << "  Commands sent: " << emag.commandsSent() << std::endl;
    std::cout << "  Errors:        " << interface_status.error_count << std::endl;
    std::cout << "  Uptime:        " << interface_status.uptime.count() << " ms" << std::endl;

    if (mock && !mock->verify()) {
        return 1;
    }
    return interface_status.error_count == 0 ? 0 : 1;
}
