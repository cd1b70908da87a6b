#pragma once

#include "transport/I2CTransport.hpp"
#include "transport/SPITransport.hpp"
#include "transport/TransportBase.hpp"
#include "transport/UARTTransport.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace payload_hal {
namespace transport {

enum class MockOperation {
    OPEN,
    CLOSE,
    READ,
    WRITE,
    TRANSFER
};

const char* operationToString(MockOperation operation);

/**
 * @brief One scripted call (or run of identical calls) on a mock transport
 *
 * Every matcher is optional; an unset matcher accepts any argument.
 * Built fluently:
 * @code
 *   mock->expectTransfer().withTx({0x01, 0x00}).withRxLength(20).returns(reply);
 *   mock->expectWrite().times(2).fails(HardwareError::timeout());
 * @endcode
 *
 * times(0) scripts a guard: the expectation is never consumed and any
 * call that reaches it is a violation.
 */
struct MockExpectation {
    MockOperation operation;
    std::optional<std::vector<uint8_t>> expected_tx;
    std::optional<size_t> expected_rx_length;
    std::optional<std::chrono::milliseconds> expected_timeout;
    uint32_t expected_calls = 1;
    uint32_t calls = 0;

    std::optional<HardwareError> error;
    std::vector<uint8_t> response;
    std::optional<size_t> reported_count;   // overrides the byte count returned
    std::chrono::milliseconds delay{0};     // completion latency

    explicit MockExpectation(MockOperation op) : operation(op) {}

    MockExpectation& withTx(std::vector<uint8_t> tx);
    MockExpectation& withRxLength(size_t length);
    MockExpectation& withTimeout(std::chrono::milliseconds timeout);
    MockExpectation& times(uint32_t count);
    MockExpectation& returns(std::vector<uint8_t> bytes);
    MockExpectation& returnsCount(size_t count);
    MockExpectation& fails(HardwareError failure);
    MockExpectation& after(std::chrono::milliseconds latency);
};

/**
 * @brief Expectation bookkeeping shared by the bus mocks
 *
 * Each operation has its own FIFO of expectations consumed in order.
 * A call that matches nothing (wrong arguments, or nothing left in the
 * queue) is a harness violation: it returns OperationFailed, is recorded
 * against the interface state, and makes verify() fail.
 * Open/close succeed when unscripted and are always counted.
 *
 * Script expectations before handing the mock to other threads; the
 * returned references stay valid until the expectation is consumed.
 */
class MockTransportBase : public TransportBase {
public:
    MockExpectation& expectOpen();
    MockExpectation& expectClose();
    MockExpectation& expectRead();
    MockExpectation& expectWrite();
    MockExpectation& expectTransfer();

    /**
     * @brief True when no violation occurred and every expectation was consumed
     */
    bool verify() const;

    std::vector<std::string> violations() const;

    /**
     * @brief Descriptions of scripted calls that never happened
     */
    std::vector<std::string> unmetExpectations() const;

    uint32_t openCount() const;
    uint32_t closeCount() const;

    /**
     * @brief Number of data-path calls (read, write, transfer) served so far
     */
    uint32_t callCount(MockOperation operation) const;

protected:
    MockTransportBase(std::string name, bool requires_equal_transfer_lengths);

    HardwareResult<void> openDevice() override;
    HardwareResult<void> closeDevice() override;

    /**
     * @brief Match a call against the head of its queue and play the scripted outcome
     *
     * For reads and transfers the response is copied into rx (clipped to
     * rx_size); the returned count is the copied length unless the
     * expectation overrides it. Writes report tx_size by default.
     */
    HardwareResult<size_t> dispatch(MockOperation operation,
                                    const uint8_t* tx_data, size_t tx_size,
                                    uint8_t* rx_data, size_t rx_size,
                                    std::optional<std::chrono::milliseconds> timeout);

private:
    std::deque<MockExpectation>& queueFor(MockOperation operation);
    const std::deque<MockExpectation>& queueFor(MockOperation operation) const;
    MockExpectation& enqueue(MockOperation operation);
    HardwareResult<void> dispatchLifecycle(MockOperation operation);
    HardwareError violation(const std::string& description);
    HardwareError guardViolation(MockOperation operation, const uint8_t* tx_data, size_t tx_size);

    mutable std::mutex mock_mutex_;
    std::deque<MockExpectation> open_queue_;
    std::deque<MockExpectation> close_queue_;
    std::deque<MockExpectation> read_queue_;
    std::deque<MockExpectation> write_queue_;
    std::deque<MockExpectation> transfer_queue_;
    std::vector<std::string> violations_;
    uint32_t open_count_;
    uint32_t close_count_;
    uint32_t read_count_;
    uint32_t write_count_;
    uint32_t transfer_count_;
};

class MockI2CTransport final : public MockTransportBase, public IBidirectional {
public:
    explicit MockI2CTransport(const I2CTransport::Config& config);
    MockI2CTransport();

    HardwareResult<size_t> read(uint8_t* data, size_t size,
                                std::chrono::milliseconds timeout) override;
    HardwareResult<size_t> write(const uint8_t* data, size_t size) override;
    HardwareResult<size_t> transfer(const uint8_t* tx_data, size_t tx_size,
                                    uint8_t* rx_data, size_t rx_size,
                                    std::chrono::milliseconds timeout) override;

    const I2CTransport::Config& getConfig() const { return config_; }

private:
    I2CTransport::Config config_;
};

class MockUARTTransport final : public MockTransportBase, public IReadable, public IWritable {
public:
    explicit MockUARTTransport(const UARTTransport::Config& config);
    MockUARTTransport();

    HardwareResult<size_t> read(uint8_t* data, size_t size,
                                std::chrono::milliseconds timeout) override;
    HardwareResult<size_t> write(const uint8_t* data, size_t size) override;

    uint32_t getBaudRate() const { return config_.baud_rate; }
    HardwareResult<void> setBaudRate(uint32_t baud_rate);

    const UARTTransport::Config& getConfig() const { return config_; }

private:
    UARTTransport::Config config_;
};

class MockSPITransport final : public MockTransportBase, public IBidirectional {
public:
    explicit MockSPITransport(const SPITransport::Config& config);
    MockSPITransport();

    HardwareResult<size_t> read(uint8_t* data, size_t size,
                                std::chrono::milliseconds timeout) override;
    HardwareResult<size_t> write(const uint8_t* data, size_t size) override;
    HardwareResult<size_t> transfer(const uint8_t* tx_data, size_t tx_size,
                                    uint8_t* rx_data, size_t rx_size,
                                    std::chrono::milliseconds timeout) override;

    uint32_t getSpeed() const { return config_.speed_hz; }
    uint8_t getMode() const { return config_.mode; }
    uint8_t getBitsPerWord() const { return config_.bits_per_word; }

    HardwareResult<void> setSpeed(uint32_t speed_hz);
    HardwareResult<void> setMode(uint8_t mode);
    HardwareResult<void> setBitsPerWord(uint8_t bits_per_word);

    const SPITransport::Config& getConfig() const { return config_; }

protected:
    HardwareResult<void> openDevice() override;

private:
    SPITransport::Config config_;
};

} // namespace transport
} // namespace payload_hal
