#include "foundry/tool_registry.hpp"
#include <stdexcept>

namespace foundry {

void ToolRegistry::add(std::string name, std::string description, nlohmann::json input_schema,
                       BuiltinHandler handler) {
    if (sealed_) throw std::logic_error("Tool registry is sealed");
    if (name.empty()) throw std::invalid_argument("Tool name must not be empty");
    if (name.find(NAMESPACE_SEPARATOR) != std::string::npos) {
        throw std::invalid_argument("Built-in tool name '" + name + "' uses the reserved separator '__'");
    }
    if (!handler) throw std::invalid_argument("Tool '" + name + "' has no handler");
    if (index_.count(name)) throw std::invalid_argument("Duplicate tool: " + name);
    if (!input_schema.is_object()) {
        input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    }

    Entry e;
    e.descriptor.name = name;
    e.descriptor.description = std::move(description);
    e.descriptor.input_schema = std::move(input_schema);
    e.descriptor.origin = ToolOrigin::Builtin;
    e.descriptor.remote_name = name;
    e.handler = std::move(handler);

    index_.emplace(std::move(name), entries_.size());
    entries_.push_back(std::move(e));
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

std::vector<ToolDescriptor> ToolRegistry::descriptors() const {
    std::vector<ToolDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.descriptor);
    return out;
}

} // namespace foundry
