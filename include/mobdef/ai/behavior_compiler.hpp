#pragma once

/// @file behavior_compiler.hpp
/// @brief Lowers the behavior DSL into a compiled BehaviorTree

#include "fwd.hpp"
#include "behavior_dsl.hpp"
#include "behavior_tree.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mobdef_ai {

/// Note produced while compiling; never fatal
struct CompileDiagnostic {
    enum class Severity : std::uint8_t {
        Info,     // Construct accepted but partially lowered
        Warning,  // Unknown node replaced by a placeholder
    };

    Severity severity = Severity::Info;
    std::string path;     // e.g. "root.children[1].child"
    std::string message;
};

[[nodiscard]] const char* diagnostic_severity_name(CompileDiagnostic::Severity severity);

struct CompileResult {
    BehaviorTreePtr tree;
    std::vector<CompileDiagnostic> diagnostics;

    [[nodiscard]] bool has_warnings() const;
};

/// Compile a DSL tree.
///
/// Forever with one child wraps that child, with several children wraps an
/// implicit Sequence. While compiles its child (the condition is attached but
/// inert). IfThen compiles only its then branch. Trigger and unknown nodes
/// compile to zero-duration waits. Pure and reentrant.
[[nodiscard]] CompileResult compile_behavior(const dsl::BehaviorNode& root, std::string_view tree_name = {});

} // namespace mobdef_ai
