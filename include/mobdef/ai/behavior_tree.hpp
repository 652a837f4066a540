/// @file behavior_tree.hpp
/// @brief Compiled behavior tree structure handed to the host runtime

#pragma once

#include "fwd.hpp"
#include "behavior_command.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mobdef_ai {

// =============================================================================
// NodeType
// =============================================================================

/// Compiled node kinds
enum class NodeType : std::uint8_t {
    // Composites
    Sequence,
    Fallback,

    // Decorators
    Forever,
    While,

    // Leaf nodes
    Wait,
    Action,
};

// =============================================================================
// Behavior Node Interface
// =============================================================================

/// @brief Base interface for all compiled nodes
class IBehaviorNode {
public:
    virtual ~IBehaviorNode() = default;

    virtual NodeType type() const = 0;
    virtual std::string_view name() const { return m_name; }
    virtual void set_name(std::string_view name) { m_name = std::string(name); }

    /// Executable children in tick order
    virtual std::size_t child_count() const { return 0; }
    virtual const IBehaviorNode* child_at(std::size_t index) const { return nullptr; }

protected:
    std::string m_name;
};

// =============================================================================
// Composite Nodes
// =============================================================================

/// @brief Base class for composite nodes with children
class CompositeNode : public IBehaviorNode {
public:
    void add_child(BehaviorNodePtr child);

    std::size_t child_count() const override { return m_children.size(); }
    const IBehaviorNode* child_at(std::size_t index) const override;

protected:
    std::vector<BehaviorNodePtr> m_children;
};

/// @brief Runs children in order until one fails
class SequenceNode : public CompositeNode {
public:
    NodeType type() const override { return NodeType::Sequence; }
};

/// @brief Runs children in order until one succeeds
class FallbackNode : public CompositeNode {
public:
    NodeType type() const override { return NodeType::Fallback; }
};

// =============================================================================
// Decorator Nodes
// =============================================================================

/// @brief Base class for decorator nodes with single child
class DecoratorNode : public IBehaviorNode {
public:
    void set_child(BehaviorNodePtr child);
    IBehaviorNode* child() const { return m_child.get(); }

    std::size_t child_count() const override { return m_child ? 1 : 0; }
    const IBehaviorNode* child_at(std::size_t index) const override;

protected:
    BehaviorNodePtr m_child;
};

/// @brief Restarts its child indefinitely
class ForeverNode : public DecoratorNode {
public:
    NodeType type() const override { return NodeType::Forever; }
};

/// @brief Repeats its child. The compiled condition is carried but not wired in.
class WhileNode : public DecoratorNode {
public:
    NodeType type() const override { return NodeType::While; }

    void set_condition(BehaviorNodePtr condition) { m_condition = std::move(condition); }
    IBehaviorNode* condition() const { return m_condition.get(); }

private:
    BehaviorNodePtr m_condition;
};

// =============================================================================
// Leaf Nodes
// =============================================================================

/// @brief Named action carrying an ordered command list
class ActionNode : public IBehaviorNode {
public:
    ActionNode(std::string_view name, std::vector<BehaviorCommand> commands);

    NodeType type() const override { return NodeType::Action; }

    const std::vector<BehaviorCommand>& commands() const { return m_commands; }

private:
    std::vector<BehaviorCommand> m_commands;
};

/// @brief Waits for a fixed duration
class WaitNode : public IBehaviorNode {
public:
    explicit WaitNode(double seconds);

    NodeType type() const override { return NodeType::Wait; }

    double seconds() const { return m_seconds; }

private:
    double m_seconds{0.0};
};

// =============================================================================
// Behavior Tree
// =============================================================================

/// @brief Complete compiled tree
class BehaviorTree {
public:
    BehaviorTree() = default;
    explicit BehaviorTree(BehaviorNodePtr root);

    void set_root(BehaviorNodePtr root) { m_root = std::move(root); }
    IBehaviorNode* root() const { return m_root.get(); }

    void set_name(std::string_view name) { m_name = std::string(name); }
    std::string_view name() const { return m_name; }

    /// Total number of executable nodes (While conditions excluded)
    std::size_t node_count() const;

    /// Maximum root-to-leaf depth (0 for an empty tree)
    std::size_t depth() const;

private:
    BehaviorNodePtr m_root;
    std::string m_name;
};

// =============================================================================
// Utility Functions
// =============================================================================

inline BehaviorNodePtr make_wait(double seconds) {
    return std::make_unique<WaitNode>(seconds);
}

/// @brief Convert node type to string
const char* node_type_to_string(NodeType type);

/// @brief Debug dump of a compiled node and its subtree
nlohmann::json node_to_json(const IBehaviorNode& node);

/// @brief Debug dump of a compiled tree
nlohmann::json tree_to_json(const BehaviorTree& tree);

} // namespace mobdef_ai
