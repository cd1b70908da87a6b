#include "transport/MockTransports.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <thread>

namespace payload_hal {
namespace transport {

namespace {

std::string toHex(const uint8_t* data, size_t size) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < size; ++i) {
        if (i > 0) oss << " ";
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    oss << "]";
    return oss.str();
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

} // namespace

const char* operationToString(MockOperation operation) {
    switch (operation) {
        case MockOperation::OPEN:     return "open";
        case MockOperation::CLOSE:    return "close";
        case MockOperation::READ:     return "read";
        case MockOperation::WRITE:    return "write";
        case MockOperation::TRANSFER: return "transfer";
        default: return "unknown";
    }
}

// ---------------------------------------------------------------------------
// MockExpectation

MockExpectation& MockExpectation::withTx(std::vector<uint8_t> tx) {
    expected_tx = std::move(tx);
    return *this;
}

MockExpectation& MockExpectation::withRxLength(size_t length) {
    expected_rx_length = length;
    return *this;
}

MockExpectation& MockExpectation::withTimeout(std::chrono::milliseconds timeout) {
    expected_timeout = timeout;
    return *this;
}

MockExpectation& MockExpectation::times(uint32_t count) {
    expected_calls = count;
    return *this;
}

MockExpectation& MockExpectation::returns(std::vector<uint8_t> bytes) {
    response = std::move(bytes);
    error.reset();
    return *this;
}

MockExpectation& MockExpectation::returnsCount(size_t count) {
    reported_count = count;
    return *this;
}

MockExpectation& MockExpectation::fails(HardwareError failure) {
    error = std::move(failure);
    return *this;
}

MockExpectation& MockExpectation::after(std::chrono::milliseconds latency) {
    delay = latency;
    return *this;
}

// ---------------------------------------------------------------------------
// MockTransportBase

MockTransportBase::MockTransportBase(std::string name, bool requires_equal_transfer_lengths)
    : TransportBase(std::move(name), requires_equal_transfer_lengths)
    , open_count_(0)
    , close_count_(0)
    , read_count_(0)
    , write_count_(0)
    , transfer_count_(0) {
}

std::deque<MockExpectation>& MockTransportBase::queueFor(MockOperation operation) {
    switch (operation) {
        case MockOperation::OPEN:  return open_queue_;
        case MockOperation::CLOSE: return close_queue_;
        case MockOperation::READ:  return read_queue_;
        case MockOperation::WRITE: return write_queue_;
        default:                   return transfer_queue_;
    }
}

const std::deque<MockExpectation>& MockTransportBase::queueFor(MockOperation operation) const {
    return const_cast<MockTransportBase*>(this)->queueFor(operation);
}

MockExpectation& MockTransportBase::enqueue(MockOperation operation) {
    std::lock_guard<std::mutex> lock(mock_mutex_);
    auto& queue = queueFor(operation);
    queue.emplace_back(operation);
    return queue.back();
}

MockExpectation& MockTransportBase::expectOpen()     { return enqueue(MockOperation::OPEN); }
MockExpectation& MockTransportBase::expectClose()    { return enqueue(MockOperation::CLOSE); }
MockExpectation& MockTransportBase::expectRead()     { return enqueue(MockOperation::READ); }
MockExpectation& MockTransportBase::expectWrite()    { return enqueue(MockOperation::WRITE); }
MockExpectation& MockTransportBase::expectTransfer() { return enqueue(MockOperation::TRANSFER); }

HardwareError MockTransportBase::violation(const std::string& description) {
    violations_.push_back(description);
    return HardwareError::operationFailed("mock violation: " + description);
}

HardwareError MockTransportBase::guardViolation(MockOperation operation,
                                               const uint8_t* tx_data, size_t tx_size) {
    std::ostringstream oss;
    oss << operationToString(operation) << " scripted never, but called";
    if (tx_data != nullptr) {
        oss << " with tx " << toHex(tx_data, tx_size);
    }
    return violation(oss.str());
}

bool MockTransportBase::verify() const {
    auto unmet = unmetExpectations();
    auto seen = violations();

    for (const auto& description : seen) {
        LOG_ERROR(name(), ": Violation: ", description);
    }
    for (const auto& description : unmet) {
        LOG_ERROR(name(), ": Unmet expectation: ", description);
    }
    return seen.empty() && unmet.empty();
}

std::vector<std::string> MockTransportBase::violations() const {
    std::lock_guard<std::mutex> lock(mock_mutex_);
    return violations_;
}

std::vector<std::string> MockTransportBase::unmetExpectations() const {
    std::lock_guard<std::mutex> lock(mock_mutex_);

    std::vector<std::string> unmet;
    for (auto operation : {MockOperation::OPEN, MockOperation::CLOSE, MockOperation::READ,
                           MockOperation::WRITE, MockOperation::TRANSFER}) {
        for (const auto& expectation : queueFor(operation)) {
            if (expectation.calls >= expectation.expected_calls) {
                continue;
            }
            std::ostringstream oss;
            oss << operationToString(operation) << " called " << expectation.calls
                << " of " << expectation.expected_calls << " times";
            if (expectation.expected_tx) {
                oss << " (tx " << toHex(*expectation.expected_tx) << ")";
            }
            unmet.push_back(oss.str());
        }
    }
    return unmet;
}

uint32_t MockTransportBase::openCount() const {
    std::lock_guard<std::mutex> lock(mock_mutex_);
    return open_count_;
}

uint32_t MockTransportBase::closeCount() const {
    std::lock_guard<std::mutex> lock(mock_mutex_);
    return close_count_;
}

uint32_t MockTransportBase::callCount(MockOperation operation) const {
    std::lock_guard<std::mutex> lock(mock_mutex_);
    switch (operation) {
        case MockOperation::OPEN:     return open_count_;
        case MockOperation::CLOSE:    return close_count_;
        case MockOperation::READ:     return read_count_;
        case MockOperation::WRITE:    return write_count_;
        case MockOperation::TRANSFER: return transfer_count_;
        default: return 0;
    }
}

HardwareResult<void> MockTransportBase::dispatchLifecycle(MockOperation operation) {
    std::optional<HardwareError> failure;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        if (operation == MockOperation::OPEN) {
            ++open_count_;
        } else {
            ++close_count_;
        }

        auto& queue = queueFor(operation);
        if (!queue.empty() && queue.front().expected_calls == 0) {
            failure = guardViolation(operation, nullptr, 0);
        } else if (!queue.empty()) {
            auto& head = queue.front();
            failure = head.error;
            delay = head.delay;
            if (++head.calls >= head.expected_calls) {
                queue.pop_front();
            }
        }
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    if (failure) {
        return *failure;
    }
    return {};
}

HardwareResult<void> MockTransportBase::openDevice() {
    return dispatchLifecycle(MockOperation::OPEN);
}

HardwareResult<void> MockTransportBase::closeDevice() {
    return dispatchLifecycle(MockOperation::CLOSE);
}

HardwareResult<size_t> MockTransportBase::dispatch(MockOperation operation,
                                                   const uint8_t* tx_data, size_t tx_size,
                                                   uint8_t* rx_data, size_t rx_size,
                                                   std::optional<std::chrono::milliseconds> timeout) {
    std::optional<HardwareError> failure;
    std::vector<uint8_t> response;
    std::optional<size_t> reported_count;
    std::chrono::milliseconds delay{0};

    {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        switch (operation) {
            case MockOperation::READ:     ++read_count_; break;
            case MockOperation::WRITE:    ++write_count_; break;
            case MockOperation::TRANSFER: ++transfer_count_; break;
            default: break;
        }

        auto& queue = queueFor(operation);
        if (queue.empty()) {
            std::ostringstream oss;
            oss << "unexpected " << operationToString(operation);
            if (tx_data != nullptr) {
                oss << " tx " << toHex(tx_data, tx_size);
            }
            return track<size_t>(violation(oss.str()));
        }

        auto& head = queue.front();
        if (head.expected_calls == 0) {
            return track<size_t>(guardViolation(operation, tx_data, tx_size));
        }
        if (head.expected_tx &&
            (head.expected_tx->size() != tx_size ||
             !std::equal(head.expected_tx->begin(), head.expected_tx->end(), tx_data))) {
            return track<size_t>(violation(
                std::string(operationToString(operation)) + " tx " + toHex(tx_data, tx_size) +
                ", expected " + toHex(*head.expected_tx)));
        }
        if (head.expected_rx_length && *head.expected_rx_length != rx_size) {
            return track<size_t>(violation(
                std::string(operationToString(operation)) + " rx length " +
                std::to_string(rx_size) + ", expected " + std::to_string(*head.expected_rx_length)));
        }
        if (head.expected_timeout && timeout && *head.expected_timeout != *timeout) {
            return track<size_t>(violation(
                std::string(operationToString(operation)) + " timeout " +
                std::to_string(timeout->count()) + " ms, expected " +
                std::to_string(head.expected_timeout->count()) + " ms"));
        }

        failure = head.error;
        response = head.response;
        reported_count = head.reported_count;
        delay = head.delay;
        if (++head.calls >= head.expected_calls) {
            queue.pop_front();
        }
    }

    // Latency is played outside the lock so status and bookkeeping stay readable
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    if (failure) {
        return track<size_t>(*failure);
    }

    if (operation == MockOperation::WRITE) {
        return reported_count.value_or(tx_size);
    }

    const size_t copied = std::min(response.size(), rx_size);
    if (copied > 0) {
        std::memcpy(rx_data, response.data(), copied);
    }
    return reported_count.value_or(copied);
}

// ---------------------------------------------------------------------------
// MockI2CTransport

MockI2CTransport::MockI2CTransport(const I2CTransport::Config& config)
    : MockTransportBase("Mock" + I2CTransport::describe(config), false)
    , config_(config) {
}

MockI2CTransport::MockI2CTransport()
    : MockI2CTransport(I2CTransport::Config{}) {
}

HardwareResult<size_t> MockI2CTransport::read(uint8_t* data, size_t size,
                                              std::chrono::milliseconds timeout) {
    auto ready = ensureInitialized();
    if (!ready) return ready.error();
    return dispatch(MockOperation::READ, nullptr, 0, data, size, timeout);
}

HardwareResult<size_t> MockI2CTransport::write(const uint8_t* data, size_t size) {
    auto ready = ensureInitialized();
    if (!ready) return ready.error();
    return dispatch(MockOperation::WRITE, data, size, nullptr, 0, std::nullopt);
}

HardwareResult<size_t> MockI2CTransport::transfer(const uint8_t* tx_data, size_t tx_size,
                                                  uint8_t* rx_data, size_t rx_size,
                                                  std::chrono::milliseconds timeout) {
    auto ready = checkTransfer(tx_size, rx_size);
    if (!ready) return ready.error();
    return dispatch(MockOperation::TRANSFER, tx_data, tx_size, rx_data, rx_size, timeout);
}

// ---------------------------------------------------------------------------
// MockUARTTransport

MockUARTTransport::MockUARTTransport(const UARTTransport::Config& config)
    : MockTransportBase("MockUART(" + config.device_path + ")", false)
    , config_(config) {
}

MockUARTTransport::MockUARTTransport()
    : MockUARTTransport(UARTTransport::Config{}) {
}

HardwareResult<size_t> MockUARTTransport::read(uint8_t* data, size_t size,
                                               std::chrono::milliseconds timeout) {
    auto ready = ensureInitialized();
    if (!ready) return ready.error();
    return dispatch(MockOperation::READ, nullptr, 0, data, size, timeout);
}

HardwareResult<size_t> MockUARTTransport::write(const uint8_t* data, size_t size) {
    auto ready = ensureInitialized();
    if (!ready) return ready.error();
    return dispatch(MockOperation::WRITE, data, size, nullptr, 0, std::nullopt);
}

HardwareResult<void> MockUARTTransport::setBaudRate(uint32_t baud_rate) {
    if (baud_rate == 0) {
        return track<void>(HardwareError::invalidParameter("baud rate must be non-zero"));
    }
    config_.baud_rate = baud_rate;
    return {};
}

// ---------------------------------------------------------------------------
// MockSPITransport

MockSPITransport::MockSPITransport(const SPITransport::Config& config)
    : MockTransportBase("MockSPI(" + config.device_path + ")", true)
    , config_(config) {
}

MockSPITransport::MockSPITransport()
    : MockSPITransport(SPITransport::Config{}) {
}

HardwareResult<void> MockSPITransport::openDevice() {
    auto valid = SPITransport::validateMode(config_.mode);
    if (!valid) {
        return valid;
    }
    return MockTransportBase::openDevice();
}

HardwareResult<size_t> MockSPITransport::read(uint8_t* data, size_t size,
                                              std::chrono::milliseconds timeout) {
    auto ready = ensureInitialized();
    if (!ready) return ready.error();
    return dispatch(MockOperation::READ, nullptr, 0, data, size, timeout);
}

HardwareResult<size_t> MockSPITransport::write(const uint8_t* data, size_t size) {
    auto ready = ensureInitialized();
    if (!ready) return ready.error();
    return dispatch(MockOperation::WRITE, data, size, nullptr, 0, std::nullopt);
}

HardwareResult<size_t> MockSPITransport::transfer(const uint8_t* tx_data, size_t tx_size,
                                                  uint8_t* rx_data, size_t rx_size,
                                                  std::chrono::milliseconds timeout) {
    auto ready = checkTransfer(tx_size, rx_size);
    if (!ready) return ready.error();
    return dispatch(MockOperation::TRANSFER, tx_data, tx_size, rx_data, rx_size, timeout);
}

HardwareResult<void> MockSPITransport::setSpeed(uint32_t speed_hz) {
    if (speed_hz == 0) {
        return track<void>(HardwareError::invalidParameter("SPI speed must be non-zero"));
    }
    config_.speed_hz = speed_hz;
    return {};
}

HardwareResult<void> MockSPITransport::setMode(uint8_t mode) {
    auto valid = SPITransport::validateMode(mode);
    if (!valid) {
        return track(valid);
    }
    config_.mode = mode;
    return {};
}

HardwareResult<void> MockSPITransport::setBitsPerWord(uint8_t bits_per_word) {
    if (bits_per_word == 0) {
        return track<void>(HardwareError::invalidParameter("bits per word must be non-zero"));
    }
    config_.bits_per_word = bits_per_word;
    return {};
}

} // namespace transport
} // namespace payload_hal
