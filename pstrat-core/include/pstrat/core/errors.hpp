#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pstrat::core {

// Failure kinds reported with engine log events. None of them is fatal.
enum class ErrorCode : std::uint8_t {
    ContractNotFound,
    DuplicateStrategyName,
    UnknownStrategyClass,
    UnknownStrategy,
    InvalidLifecycleTransition,
    StrategyCallbackFault,
    InitQueueFull,
    PersistenceFailure,
};

const char* toString(ErrorCode code) noexcept;

// Thrown only at startup when a configuration file cannot be used
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace pstrat::core
