#pragma once

#include <stdexcept>
#include <string>

namespace mycelium::core {

// Common base for all recoverable graph errors. A rejected operation never
// leaves the graph partially mutated.
struct GraphError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Reference to a node that does not exist.
struct UnknownNode : public GraphError {
  using GraphError::GraphError;
};

// Edge insertion referencing a node that does not exist.
struct UnknownEndpoint : public GraphError {
  using GraphError::GraphError;
};

struct DuplicateIdentifier : public GraphError {
  using GraphError::GraphError;
};

// Deletion or lookup of an absent element.
struct NotFound : public GraphError {
  using GraphError::GraphError;
};

struct InvalidArgument : public GraphError {
  using GraphError::GraphError;
};

} // namespace mycelium::core
