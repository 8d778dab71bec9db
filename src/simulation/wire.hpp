#pragma once

/// @file wire.hpp
/// @brief Wire model — connects gate outputs to gate inputs

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace gatesynth {

class Gate; // Forward declaration

/// Represents a wire connecting a gate output to one or more gate inputs.
///
/// A wire with a nullptr source is a primary input wire (its value is set
/// externally). Primary inputs and outputs carry the variable or output name
/// they were created for; internal wires keep an empty name.
class Wire {
  public:
    /// Construct a wire with a unique ID
    explicit Wire(uint32_t id);

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] bool get_value() const { return value_; }
    [[nodiscard]] Gate* get_source() const { return source_; }
    [[nodiscard]] const std::vector<Gate*>& get_destinations() const { return destinations_; }
    [[nodiscard]] const std::string& get_name() const { return name_; }

    void set_value(bool value) { value_ = value; }
    void set_source(Gate* gate) { source_ = gate; }
    void set_name(std::string name) { name_ = std::move(name); }

    /// Adds a destination gate that reads from this wire
    void add_destination(Gate* gate);

  private:
    uint32_t id_;
    bool value_ = false;
    Gate* source_ = nullptr;
    std::vector<Gate*> destinations_;
    std::string name_;
};

} // namespace gatesynth
