#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "operations/operation.hpp"

namespace harbor::operations {

// Name -> operation catalog. Registration happens at startup; after
// `freeze()` the registry is read-only and may be shared between sessions
// without locking.
class OperationRegistry {
public:
    core::errors::Result<std::string> register_operation(std::unique_ptr<Operation> operation);
    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

    // Case-insensitive.
    Operation* find(const std::string& name) const;
    core::errors::Result<Operation*> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Registration order.
    std::vector<std::string> list() const;
    std::size_t size() const { return operations_.size(); }

    // Human readable catalog for the first prompt.
    std::string describe_catalog() const;

    // First operation, in registration order, whose name or inference keywords
    // occur in `text`.
    std::optional<std::string> infer_from_text(const std::string& text) const;

private:
    static std::string fold(const std::string& name);

    bool frozen_ = false;
    std::vector<std::unique_ptr<Operation>> operations_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace harbor::operations
