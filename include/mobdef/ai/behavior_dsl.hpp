#pragma once

/// @file behavior_dsl.hpp
/// @brief Declarative behavior node DSL (tagged by `type`) and its child-slot layout

#include "fwd.hpp"
#include "behavior_command.hpp"

#include <mobdef/core/indirect.hpp>
#include <mobdef/data/value.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mobdef_ai {

// =============================================================================
// BehaviorNodeType
// =============================================================================

enum class BehaviorNodeType : std::uint8_t {
    Forever,
    Sequence,
    Fallback,
    While,
    IfThen,
    Wait,
    Action,
    Trigger,
};

inline constexpr BehaviorNodeType k_all_node_types[] = {
    BehaviorNodeType::Forever, BehaviorNodeType::Sequence, BehaviorNodeType::Fallback,
    BehaviorNodeType::While, BehaviorNodeType::IfThen, BehaviorNodeType::Wait,
    BehaviorNodeType::Action, BehaviorNodeType::Trigger,
};

[[nodiscard]] const char* behavior_node_type_name(BehaviorNodeType type);

/// Case-sensitive lookup of a `type` tag
[[nodiscard]] std::optional<BehaviorNodeType> parse_behavior_node_type(std::string_view name);

// =============================================================================
// Child-slot layout
// =============================================================================

/// A named single-child slot of a non-control node
struct ChildSlot {
    const char* key = nullptr;
    bool optional = false;
};

/// How path indices map onto a node type's children.
/// Control nodes index their `children` array; While and IfThen index
/// fixed named slots; leaves have no children.
struct NodeLayout {
    BehaviorNodeType type;
    bool has_child_array = false;
    std::array<ChildSlot, 3> slots{};
    std::size_t slot_count = 0;

    [[nodiscard]] bool is_control() const noexcept { return has_child_array; }
    [[nodiscard]] bool is_leaf() const noexcept { return !has_child_array && slot_count == 0; }

    /// Slot at a path index, nullptr past the end or for control/leaf nodes
    [[nodiscard]] const ChildSlot* slot(std::size_t index) const noexcept {
        return index < slot_count ? &slots[index] : nullptr;
    }
};

[[nodiscard]] const NodeLayout& node_layout(BehaviorNodeType type);

/// Fields a node of `type` is initialized with when created or retyped
/// (excluding `type` itself)
[[nodiscard]] mobdef_data::Table node_default_fields(BehaviorNodeType type);

/// Complete default node table of `type`
[[nodiscard]] mobdef_data::Value default_node(BehaviorNodeType type);

/// Action node with the given name and no commands
[[nodiscard]] mobdef_data::Value default_action(const std::string& name);

namespace dsl {

// =============================================================================
// Typed DSL nodes
// =============================================================================

class BehaviorNode;
using NodeBox = mobdef_core::Indirect<BehaviorNode>;

struct ForeverNode {
    std::vector<BehaviorNode> children;
    bool operator==(const ForeverNode&) const = default;
};

struct SequenceNode {
    std::vector<BehaviorNode> children;
    bool operator==(const SequenceNode&) const = default;
};

struct FallbackNode {
    std::vector<BehaviorNode> children;
    bool operator==(const FallbackNode&) const = default;
};

struct WhileNode {
    std::optional<NodeBox> condition;
    NodeBox child;
    bool operator==(const WhileNode&) const = default;
};

struct IfThenNode {
    NodeBox condition;
    NodeBox then_child;
    std::optional<NodeBox> else_child;
    bool operator==(const IfThenNode&) const = default;
};

struct WaitNode {
    double seconds = 0.0;
    bool operator==(const WaitNode&) const = default;
};

struct ActionNode {
    std::string name;
    std::vector<BehaviorCommand> behaviors;
    bool operator==(const ActionNode&) const = default;
};

struct TriggerNode {
    std::string trigger_type;
    bool operator==(const TriggerNode&) const = default;
};

/// Table that did not parse as any known node. Keeps the raw data.
struct UnknownNode {
    std::string type_name;
    std::string reason;
    mobdef_data::Value raw;
    bool operator==(const UnknownNode&) const = default;
};

/// One node of the behavior DSL
class BehaviorNode {
public:
    using Variant = std::variant<
        ForeverNode,
        SequenceNode,
        FallbackNode,
        WhileNode,
        IfThenNode,
        WaitNode,
        ActionNode,
        TriggerNode,
        UnknownNode
    >;

    BehaviorNode(ForeverNode n) : m_data(std::move(n)) {}
    BehaviorNode(SequenceNode n) : m_data(std::move(n)) {}
    BehaviorNode(FallbackNode n) : m_data(std::move(n)) {}
    BehaviorNode(WhileNode n) : m_data(std::move(n)) {}
    BehaviorNode(IfThenNode n) : m_data(std::move(n)) {}
    BehaviorNode(WaitNode n) : m_data(std::move(n)) {}
    BehaviorNode(ActionNode n) : m_data(std::move(n)) {}
    BehaviorNode(TriggerNode n) : m_data(std::move(n)) {}
    BehaviorNode(UnknownNode n) : m_data(std::move(n)) {}

    /// Node type, nullopt for UnknownNode
    [[nodiscard]] std::optional<BehaviorNodeType> type() const noexcept {
        if (std::holds_alternative<UnknownNode>(m_data)) {
            return std::nullopt;
        }
        return static_cast<BehaviorNodeType>(m_data.index());
    }

    [[nodiscard]] bool is_unknown() const noexcept { return std::holds_alternative<UnknownNode>(m_data); }

    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_data); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_data; }

    bool operator==(const BehaviorNode& other) const { return m_data == other.m_data; }

private:
    Variant m_data;
};

} // namespace dsl

// =============================================================================
// Conversion
// =============================================================================

/// Parse a behavior table. Never fails: anything that is not a valid node
/// becomes an UnknownNode carrying the reason. Children parse independently.
[[nodiscard]] dsl::BehaviorNode parse_behavior_node(const mobdef_data::Value& value);

/// Serialize a node back to its table form (UnknownNode yields its raw data)
[[nodiscard]] mobdef_data::Value behavior_to_value(const dsl::BehaviorNode& node);

/// Number of UnknownNode entries in the subtree
[[nodiscard]] std::size_t count_unknown_nodes(const dsl::BehaviorNode& node);

} // namespace mobdef_ai
