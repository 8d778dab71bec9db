/// @file wire.cpp
/// @brief Wire class implementation

#include "simulation/wire.hpp"

namespace gatesynth {

Wire::Wire(uint32_t id) : id_(id) {}

void Wire::add_destination(Gate* gate) {
    destinations_.push_back(gate);
}

} // namespace gatesynth
