#include "harness/TestData.hpp"
#include "harness/TestRunner.hpp"
#include "transport/MockTransports.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <memory>

using namespace payload_hal;
using transport::HardwareResult;

namespace {

using SpiRunner = harness::TestRunner<transport::MockSPITransport>;
using SpiInterface = harness::SharedInterface<transport::MockSPITransport>;

std::shared_ptr<transport::MockSPITransport> createLoopbackSpi() {
    auto spi = std::make_shared<transport::MockSPITransport>();
    auto pattern = harness::createTestData(16);

    spi->expectTransfer().withTx(pattern).returns(pattern);
    spi->expectWrite().times(4);
    return spi;
}

} // namespace

int main() {
    utils::Logger::getInstance().setLevel(utils::LogLevel::WARN);

    auto spi = createLoopbackSpi();
    SpiRunner runner(spi);

    std::vector<SpiRunner::TestCase> cases = {
        {"initialize", [](SpiInterface iface) -> HardwareResult<void> {
            return iface.lock()->initialize();
        }, std::nullopt},
        {"loopback", [](SpiInterface iface) -> HardwareResult<void> {
            auto tx = harness::createTestData(16);
            std::vector<uint8_t> rx(tx.size());
            auto received = iface.lock()->transfer(tx.data(), tx.size(), rx.data(), rx.size(),
                                                   std::chrono::milliseconds{100});
            if (!received) return received.error();
            if (!harness::verifyTestData(rx)) {
                return transport::HardwareError::communication("loopback pattern mismatch");
            }
            return {};
        }, std::nullopt},
        {"burst_write", [](SpiInterface iface) -> HardwareResult<void> {
            auto data = harness::createTestData(4);
            auto guard = iface.lock();
            for (int i = 0; i < 4; ++i) {
                auto written = guard->writeAll(data.data(), data.size());
                if (!written) return written;
            }
            return {};
        }, std::nullopt},
        SpiRunner::TestCase::skipped("dma_transfer", "no DMA channel on mock bus"),
        {"deinitialize", [](SpiInterface iface) -> HardwareResult<void> {
            return iface.lock()->deinitialize();
        }, std::nullopt},
    };

    auto suite = runner.runTestSuite("spi_selftest", cases);
    std::cout << suite << std::endl;

    if (!spi->verify()) {
        std::cout << "Mock expectations not met" << std::endl;
        return 1;
    }
    return suite.allPassed() ? 0 : 1;
}
