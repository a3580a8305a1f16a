#pragma once
#include "types.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace foundry {

/// Handler for a built-in tool. Returns the structured result or throws;
/// the router turns exceptions into execution errors.
using BuiltinHandler = std::function<nlohmann::json(const nlohmann::json& args)>;

/// Table of built-in tools, populated at startup and then sealed. Once
/// sealed it is read concurrently without locking.
class ToolRegistry {
public:
    struct Entry {
        ToolDescriptor descriptor;
        BuiltinHandler handler;
    };

    /// Throws std::logic_error after seal(), std::invalid_argument for an
    /// empty or duplicate name or one containing the namespace separator.
    void add(std::string name, std::string description, nlohmann::json input_schema,
             BuiltinHandler handler);

    void seal() noexcept { sealed_ = true; }
    [[nodiscard]] bool sealed() const noexcept { return sealed_; }

    [[nodiscard]] const Entry* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const { return find(name) != nullptr; }
    [[nodiscard]] std::vector<ToolDescriptor> descriptors() const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    bool sealed_ = false;
};

} // namespace foundry
