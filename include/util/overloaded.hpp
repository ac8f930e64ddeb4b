#pragma once

namespace otadump {

// Builds a visitor out of lambdas for std::visit.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace otadump
