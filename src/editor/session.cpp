/// @file session.cpp
/// @brief Editor session: one document with history, status log and file I/O

#include <mobdef/editor/session.hpp>
#include <mobdef/ai/behavior_dsl.hpp>
#include <mobdef/core/log.hpp>
#include <mobdef/data/merge.hpp>
#include <mobdef/data/toml_codec.hpp>

#include <fstream>
#include <iterator>

namespace mobdef_editor {

namespace fs = std::filesystem;
using mobdef_data::Value;

// =============================================================================
// Names / StatusLog
// =============================================================================

const char* file_type_name(FileType type) {
    switch (type) {
        case FileType::Mob: return "mob";
        case FileType::MobPatch: return "mobpatch";
        default: return "unknown";
    }
}

const char* status_level_name(StatusLevel level) {
    switch (level) {
        case StatusLevel::Success: return "success";
        case StatusLevel::Warning: return "warning";
        case StatusLevel::Error: return "error";
        default: return "unknown";
    }
}

void StatusLog::push(std::string text, StatusLevel level) {
    m_entries.push_back(StatusEntry{std::move(text), level, std::chrono::system_clock::now()});
    while (m_entries.size() > k_max_entries) {
        m_entries.pop_front();
    }
}

// =============================================================================
// EditorSession
// =============================================================================

EditorSession::EditorSession(std::size_t history_limit, mobdef_core::LayerPaths rules)
    : m_rules(std::move(rules)), m_history(history_limit) {}

void EditorSession::fail(const std::string& message) {
    mobdef_core::editor_logger()->warn("[EditorSession] {}", message);
    m_log.push(message, StatusLevel::Error);
}

void EditorSession::document_changed() {
    m_modified = m_document && m_original ? !mobdef_data::values_equal_loose(*m_document, *m_original)
                                          : m_document.has_value();

    if (m_document && m_file_type == FileType::MobPatch && m_base) {
        m_preview = mobdef_data::merged(*m_base, *m_document);
    } else {
        m_preview.reset();
    }
}

// -----------------------------------------------------------------------------
// Documents
// -----------------------------------------------------------------------------

bool EditorSession::load(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        fail("Cannot open " + path.string());
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::string filename = path.filename().string();
    const std::string& ext = m_rules.patch_extension;
    bool is_patch = filename.size() > ext.size() &&
                    filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
    return load_string(text, path, is_patch ? FileType::MobPatch : FileType::Mob);
}

bool EditorSession::load_string(const std::string& text, const fs::path& path, FileType type) {
    auto parsed = mobdef_data::parse_toml(text, path.string());
    if (!parsed) {
        fail(parsed.error().message());
        return false;
    }

    m_document = std::move(*parsed);
    m_original = m_document;
    m_path = path;
    m_file_type = type;
    m_history.clear();
    document_changed();

    m_log.push("Loaded " + path.filename().string(), StatusLevel::Success);
    mobdef_core::editor_logger()->info("[EditorSession] Loaded {} ({})", path.string(), file_type_name(type));
    return true;
}

void EditorSession::new_document(const std::string& name, FileType type) {
    Value doc = Value::table({{"name", Value(name)}});
    if (type == FileType::Mob) {
        doc.set("spawnable", true);
        doc.set("health", 50);
        doc.set("colliders", Value::array({Value::table({
            {"shape", Value::table({{"Rectangle", Value::array({Value(10.0), Value(10.0)})}})},
            {"position", Value::array({Value(0.0), Value(0.0)})},
            {"rotation", Value(0.0)},
        })}));
    }

    m_document = std::move(doc);
    m_original.reset();
    m_path.reset();
    m_file_type = type;
    m_history.clear();
    document_changed();
    m_log.push("Created new " + std::string(file_type_name(type)) + " '" + name + "'", StatusLevel::Success);
}

void EditorSession::close() {
    m_document.reset();
    m_original.reset();
    m_base.reset();
    m_path.reset();
    m_history.clear();
    document_changed();
}

// -----------------------------------------------------------------------------
// Editing
// -----------------------------------------------------------------------------

bool EditorSession::edit(const std::function<void(Value&)>& fn) {
    if (!m_document) {
        fail("No document open");
        return false;
    }

    Value snapshot = *m_document;
    fn(*m_document);
    if (*m_document == snapshot) {
        return false;
    }

    m_history.push(std::move(snapshot));
    document_changed();
    return true;
}

bool EditorSession::edit_behavior(const std::function<void(Value&)>& fn) {
    if (m_document && !m_document->contains("behavior")) {
        fail("Document has no behavior tree");
        return false;
    }
    return edit([&](Value& doc) { fn(*doc.get_mut("behavior")); });
}

bool EditorSession::undo() {
    if (!m_document) {
        fail("No document open");
        return false;
    }
    auto previous = m_history.undo(*m_document);
    if (!previous) {
        m_log.push("Nothing to undo", StatusLevel::Warning);
        return false;
    }
    m_document = std::move(*previous);
    document_changed();
    return true;
}

bool EditorSession::redo() {
    if (!m_document) {
        fail("No document open");
        return false;
    }
    auto next = m_history.redo(*m_document);
    if (!next) {
        m_log.push("Nothing to redo", StatusLevel::Warning);
        return false;
    }
    m_document = std::move(*next);
    document_changed();
    return true;
}

// -----------------------------------------------------------------------------
// Preview
// -----------------------------------------------------------------------------

void EditorSession::set_base_document(std::optional<Value> base) {
    m_base = std::move(base);
    document_changed();
}

const Value* EditorSession::document_for_preview() const {
    if (m_preview) {
        return &*m_preview;
    }
    return document();
}

std::optional<mobdef_ai::CompileResult> EditorSession::compile_preview() const {
    const Value* doc = document_for_preview();
    const Value* behavior = doc ? doc->get("behavior") : nullptr;
    if (behavior == nullptr) {
        return std::nullopt;
    }

    const std::string* name = doc->get_string("name");
    return mobdef_ai::compile_behavior(mobdef_ai::parse_behavior_node(*behavior), name ? *name : "");
}

// -----------------------------------------------------------------------------
// Saving
// -----------------------------------------------------------------------------

mobdef_asset::ValidationResult EditorSession::validate() const {
    if (!m_document) {
        mobdef_asset::ValidationResult result;
        result.add_error("", "No document open");
        return result;
    }
    return mobdef_asset::validate_mob(*m_document, m_file_type == FileType::MobPatch);
}

bool EditorSession::save(const std::optional<fs::path>& path) {
    if (!m_document) {
        fail("No document open");
        return false;
    }
    std::optional<fs::path> target = path ? path : m_path;
    if (!target) {
        fail("No file path to save to");
        return false;
    }

    auto validation = validate();
    if (validation.has_errors()) {
        auto messages = validation.error_messages();
        fail("Validation failed with " + std::to_string(messages.size()) + " error(s): " + messages.front());
        return false;
    }
    for (const auto& issue : validation.issues()) {
        m_log.push(issue.to_string(), StatusLevel::Warning);
    }

    auto text = mobdef_data::to_toml_string(*m_document);
    if (!text) {
        fail(text.error().message());
        return false;
    }

    std::error_code ec;
    if (fs::exists(*target, ec)) {
        fs::path backup = target->string() + ".bak";
        fs::copy_file(*target, backup, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fail("Cannot back up " + target->string() + ": " + ec.message());
            return false;
        }
    }

    if (target->has_parent_path()) {
        fs::create_directories(target->parent_path(), ec);
        if (ec) {
            fail("Cannot create " + target->parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    fs::path temp = target->string() + ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out || !(out << *text) || !out.flush()) {
            fail("Cannot write " + temp.string());
            return false;
        }
    }
    fs::rename(temp, *target, ec);
    if (ec) {
        fail("Cannot replace " + target->string() + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }

    m_path = *target;
    m_original = m_document;
    document_changed();
    m_log.push("Saved " + target->filename().string(), StatusLevel::Success);
    mobdef_core::editor_logger()->info("[EditorSession] Saved {}", target->string());
    return true;
}

} // namespace mobdef_editor
