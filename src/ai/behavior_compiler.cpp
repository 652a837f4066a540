/// @file behavior_compiler.cpp
/// @brief Behavior DSL -> compiled tree lowering

#include <mobdef/ai/behavior_compiler.hpp>
#include <mobdef/core/log.hpp>

namespace mobdef_ai {

const char* diagnostic_severity_name(CompileDiagnostic::Severity severity) {
    switch (severity) {
        case CompileDiagnostic::Severity::Info: return "info";
        case CompileDiagnostic::Severity::Warning: return "warning";
        default: return "unknown";
    }
}

bool CompileResult::has_warnings() const {
    for (const auto& diag : diagnostics) {
        if (diag.severity == CompileDiagnostic::Severity::Warning) {
            return true;
        }
    }
    return false;
}

namespace {

class Lowering {
public:
    explicit Lowering(std::vector<CompileDiagnostic>& diagnostics) : m_diagnostics(diagnostics) {}

    BehaviorNodePtr lower(const dsl::BehaviorNode& node, const std::string& path) {
        return std::visit([&](const auto& n) { return lower_node(n, path); }, node.variant());
    }

private:
    void note(CompileDiagnostic::Severity severity, const std::string& path, std::string message) {
        m_diagnostics.push_back(CompileDiagnostic{severity, path, std::move(message)});
    }

    template<typename Composite>
    std::unique_ptr<Composite> lower_children(const std::vector<dsl::BehaviorNode>& children,
                                              const std::string& path) {
        auto composite = std::make_unique<Composite>();
        for (std::size_t i = 0; i < children.size(); ++i) {
            composite->add_child(lower(children[i], path + ".children[" + std::to_string(i) + "]"));
        }
        return composite;
    }

    BehaviorNodePtr lower_node(const dsl::ForeverNode& n, const std::string& path) {
        auto forever = std::make_unique<ForeverNode>();
        if (n.children.size() == 1) {
            forever->set_child(lower(n.children.front(), path + ".children[0]"));
        } else {
            forever->set_child(lower_children<SequenceNode>(n.children, path));
        }
        return forever;
    }

    BehaviorNodePtr lower_node(const dsl::SequenceNode& n, const std::string& path) {
        return lower_children<SequenceNode>(n.children, path);
    }

    BehaviorNodePtr lower_node(const dsl::FallbackNode& n, const std::string& path) {
        return lower_children<FallbackNode>(n.children, path);
    }

    BehaviorNodePtr lower_node(const dsl::WhileNode& n, const std::string& path) {
        auto node = std::make_unique<WhileNode>();
        if (n.condition) {
            node->set_condition(lower(**n.condition, path + ".condition"));
            note(CompileDiagnostic::Severity::Info, path, "While condition is not evaluated");
        }
        node->set_child(lower(*n.child, path + ".child"));
        return node;
    }

    BehaviorNodePtr lower_node(const dsl::IfThenNode& n, const std::string& path) {
        std::string message = "IfThen compiles only its then branch; condition";
        message += n.else_child ? " and else branch ignored" : " ignored";
        note(CompileDiagnostic::Severity::Info, path, std::move(message));
        return lower(*n.then_child, path + ".then_child");
    }

    BehaviorNodePtr lower_node(const dsl::WaitNode& n, const std::string&) {
        return make_wait(n.seconds);
    }

    BehaviorNodePtr lower_node(const dsl::ActionNode& n, const std::string&) {
        return std::make_unique<ActionNode>(n.name, n.behaviors);
    }

    BehaviorNodePtr lower_node(const dsl::TriggerNode& n, const std::string& path) {
        note(CompileDiagnostic::Severity::Info, path,
             "Trigger '" + n.trigger_type + "' compiles to a zero-duration wait");
        auto wait = make_wait(0.0);
        wait->set_name("Trigger:" + n.trigger_type);
        return wait;
    }

    BehaviorNodePtr lower_node(const dsl::UnknownNode& n, const std::string& path) {
        std::string label = n.type_name.empty() ? "<untyped>" : n.type_name;
        note(CompileDiagnostic::Severity::Warning, path,
             "Unknown node '" + label + "' replaced by zero-duration wait: " + n.reason);
        return make_wait(0.0);
    }

    std::vector<CompileDiagnostic>& m_diagnostics;
};

} // anonymous namespace

CompileResult compile_behavior(const dsl::BehaviorNode& root, std::string_view tree_name) {
    CompileResult result;
    Lowering lowering(result.diagnostics);

    result.tree = std::make_unique<BehaviorTree>(lowering.lower(root, "root"));
    result.tree->set_name(tree_name);

    auto logger = mobdef_core::ai_logger();
    for (const auto& diag : result.diagnostics) {
        if (diag.severity == CompileDiagnostic::Severity::Warning) {
            logger->warn("[BehaviorCompiler] '{}' at {}: {}", tree_name, diag.path, diag.message);
        }
    }
    logger->debug("[BehaviorCompiler] Compiled '{}': {} nodes, {} diagnostics",
                  tree_name, result.tree->node_count(), result.diagnostics.size());
    return result;
}

} // namespace mobdef_ai
