#pragma once

#include <stdexcept>
#include <string>

namespace swisspair::core::model {

enum class PairingErrorKind {
    Unsatisfiable,
    FormatLimit,
    MalformedHistory,
    Parse,
    Configuration
};

class PairingError : public std::runtime_error {
public:
    PairingError(PairingErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    PairingErrorKind kind() const { return kind_; }

private:
    PairingErrorKind kind_;
};

std::string PairingErrorKindToString(PairingErrorKind kind);

}  // namespace swisspair::core::model
