#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mobdef_ai

#include <cstdint>
#include <memory>

namespace mobdef_ai {

// =============================================================================
// Behavior DSL
// =============================================================================

enum class BehaviorNodeType : std::uint8_t;
enum class CommandKind : std::uint8_t;
struct BehaviorCommand;
struct NodeLayout;

namespace dsl {
class BehaviorNode;
} // namespace dsl

// =============================================================================
// Compiled Tree
// =============================================================================

enum class NodeType : std::uint8_t;
class IBehaviorNode;
class BehaviorTree;

using BehaviorNodePtr = std::unique_ptr<IBehaviorNode>;
using BehaviorTreePtr = std::unique_ptr<BehaviorTree>;

struct CompileDiagnostic;
struct CompileResult;

} // namespace mobdef_ai
