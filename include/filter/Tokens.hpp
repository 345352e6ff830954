#pragma once

#include "types/VoyageContext.hpp"

#include <ctime>
#include <stdexcept>
#include <string>

namespace ovdm::filter {

// A voyage token refers to something that is not active right now (e.g. {loweringID} between dives).
class ContextUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A definition cannot be resolved no matter the voyage state.
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class TokenMode {
    Path,    // date tokens take the current UTC time
    Pattern  // date tokens become glob character classes
};

struct TokenContext {
    const types::VoyageContext& voyage;
    std::string lowering_base_dir{};
    std::time_t now{};
};

std::string substitute(const std::string& tmpl, const TokenContext& ctx, TokenMode mode);

}
