/// @file behavior_tree.cpp
/// @brief Compiled behavior tree implementation for mobdef_ai

#include <mobdef/ai/behavior_tree.hpp>

#include <mobdef/data/json_codec.hpp>

#include <algorithm>

namespace mobdef_ai {

// =============================================================================
// CompositeNode Implementation
// =============================================================================

void CompositeNode::add_child(BehaviorNodePtr child) {
    if (child) {
        m_children.push_back(std::move(child));
    }
}

const IBehaviorNode* CompositeNode::child_at(std::size_t index) const {
    return index < m_children.size() ? m_children[index].get() : nullptr;
}

// =============================================================================
// DecoratorNode Implementation
// =============================================================================

void DecoratorNode::set_child(BehaviorNodePtr child) {
    m_child = std::move(child);
}

const IBehaviorNode* DecoratorNode::child_at(std::size_t index) const {
    return index == 0 ? m_child.get() : nullptr;
}

// =============================================================================
// Leaf Implementations
// =============================================================================

ActionNode::ActionNode(std::string_view name, std::vector<BehaviorCommand> commands)
    : m_commands(std::move(commands))
{
    m_name = std::string(name);
}

WaitNode::WaitNode(double seconds)
    : m_seconds(seconds)
{
}

// =============================================================================
// BehaviorTree Implementation
// =============================================================================

namespace {

std::size_t count_nodes(const IBehaviorNode* node) {
    if (!node) return 0;
    std::size_t count = 1;
    for (std::size_t i = 0; i < node->child_count(); ++i) {
        count += count_nodes(node->child_at(i));
    }
    return count;
}

std::size_t measure_depth(const IBehaviorNode* node) {
    if (!node) return 0;
    std::size_t deepest = 0;
    for (std::size_t i = 0; i < node->child_count(); ++i) {
        deepest = std::max(deepest, measure_depth(node->child_at(i)));
    }
    return deepest + 1;
}

} // anonymous namespace

BehaviorTree::BehaviorTree(BehaviorNodePtr root)
    : m_root(std::move(root))
{
}

std::size_t BehaviorTree::node_count() const {
    return count_nodes(m_root.get());
}

std::size_t BehaviorTree::depth() const {
    return measure_depth(m_root.get());
}

// =============================================================================
// Utility Functions
// =============================================================================

const char* node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::Sequence: return "Sequence";
        case NodeType::Fallback: return "Fallback";
        case NodeType::Forever: return "Forever";
        case NodeType::While: return "While";
        case NodeType::Wait: return "Wait";
        case NodeType::Action: return "Action";
        default: return "Unknown";
    }
}

nlohmann::json node_to_json(const IBehaviorNode& node) {
    nlohmann::json j;
    j["type"] = node_type_to_string(node.type());

    switch (node.type()) {
        case NodeType::Wait:
            j["seconds"] = static_cast<const WaitNode&>(node).seconds();
            break;
        case NodeType::Action:
            j["name"] = std::string(node.name());
            j["commands"] = mobdef_data::to_json(
                commands_to_value(static_cast<const ActionNode&>(node).commands()));
            break;
        case NodeType::While:
            if (auto* condition = static_cast<const WhileNode&>(node).condition()) {
                j["condition"] = node_to_json(*condition);
            }
            break;
        default:
            break;
    }

    if (node.child_count() > 0) {
        nlohmann::json children = nlohmann::json::array();
        for (std::size_t i = 0; i < node.child_count(); ++i) {
            if (auto* child = node.child_at(i)) {
                children.push_back(node_to_json(*child));
            }
        }
        j["children"] = std::move(children);
    }

    return j;
}

nlohmann::json tree_to_json(const BehaviorTree& tree) {
    nlohmann::json j;
    j["name"] = std::string(tree.name());
    j["node_count"] = tree.node_count();
    j["root"] = tree.root() ? node_to_json(*tree.root()) : nlohmann::json(nullptr);
    return j;
}

} // namespace mobdef_ai
