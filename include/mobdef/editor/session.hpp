#pragma once

/// @file session.hpp
/// @brief Editor session: one document with history, status log and file I/O

#include "history.hpp"

#include <mobdef/ai/behavior_compiler.hpp>
#include <mobdef/asset/validation.hpp>
#include <mobdef/core/config.hpp>
#include <mobdef/data/value.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace mobdef_editor {

// =============================================================================
// StatusLog
// =============================================================================

enum class FileType : std::uint8_t {
    Mob,       // complete definition
    MobPatch,  // partial override of a base definition
};

[[nodiscard]] const char* file_type_name(FileType type);

enum class StatusLevel : std::uint8_t {
    Success,
    Warning,
    Error,
};

[[nodiscard]] const char* status_level_name(StatusLevel level);

struct StatusEntry {
    std::string text;
    StatusLevel level = StatusLevel::Success;
    std::chrono::system_clock::time_point timestamp;
};

/// Bounded message log shown to the user; oldest entries are dropped
class StatusLog {
public:
    static constexpr std::size_t k_max_entries = 50;

    void push(std::string text, StatusLevel level);

    [[nodiscard]] const std::deque<StatusEntry>& entries() const { return m_entries; }
    [[nodiscard]] const StatusEntry* last() const { return m_entries.empty() ? nullptr : &m_entries.back(); }
    [[nodiscard]] std::size_t size() const { return m_entries.size(); }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }
    void clear() { m_entries.clear(); }

private:
    std::deque<StatusEntry> m_entries;
};

// =============================================================================
// EditorSession
// =============================================================================

/// Owns the document being edited.
/// Failures are reported to the status log and as a false return.
class EditorSession {
public:
    explicit EditorSession(std::size_t history_limit = UndoHistory<mobdef_data::Value>::k_default_max_size,
                           mobdef_core::LayerPaths rules = {});

    // -------------------------------------------------------------------------
    // Documents
    // -------------------------------------------------------------------------

    /// Load a file; the file type follows its extension
    bool load(const std::filesystem::path& path);

    /// Load TOML text as if read from `path`
    bool load_string(const std::string& text, const std::filesystem::path& path, FileType type);

    /// Start an unsaved document. Mobs get name, spawnable, health and a
    /// default collider; patches only a name.
    void new_document(const std::string& name, FileType type);

    /// Close the document and drop its history
    void close();

    [[nodiscard]] bool has_document() const { return m_document.has_value(); }
    [[nodiscard]] const mobdef_data::Value* document() const { return m_document ? &*m_document : nullptr; }
    [[nodiscard]] FileType file_type() const { return m_file_type; }
    [[nodiscard]] const std::optional<std::filesystem::path>& current_path() const { return m_path; }

    /// Document differs from the loaded or last saved state (Integer(n) and
    /// Float(n) compare equal)
    [[nodiscard]] bool is_modified() const { return m_modified; }

    // -------------------------------------------------------------------------
    // Editing
    // -------------------------------------------------------------------------

    /// Apply `fn` to the document. A history entry is kept only if the
    /// document changed.
    /// @return true if the document changed
    bool edit(const std::function<void(mobdef_data::Value&)>& fn);

    /// edit() restricted to the document's behavior tree
    bool edit_behavior(const std::function<void(mobdef_data::Value&)>& fn);

    bool undo();
    bool redo();

    [[nodiscard]] const UndoHistory<mobdef_data::Value>& history() const { return m_history; }

    // -------------------------------------------------------------------------
    // Preview
    // -------------------------------------------------------------------------

    /// Base definition a patch document is previewed against
    void set_base_document(std::optional<mobdef_data::Value> base);

    /// Base merged with the patch for patch documents, the document otherwise
    [[nodiscard]] const mobdef_data::Value* document_for_preview() const;

    /// Compile the previewed behavior, nullopt without a behavior
    [[nodiscard]] std::optional<mobdef_ai::CompileResult> compile_preview() const;

    // -------------------------------------------------------------------------
    // Saving
    // -------------------------------------------------------------------------

    [[nodiscard]] mobdef_asset::ValidationResult validate() const;

    /// Validate, back up the existing file as <file>.bak, then write through a
    /// temporary file. Without `path` the current path is used.
    bool save(const std::optional<std::filesystem::path>& path = std::nullopt);

    [[nodiscard]] const StatusLog& log() const { return m_log; }

private:
    void document_changed();
    void fail(const std::string& message);

    mobdef_core::LayerPaths m_rules;
    std::optional<mobdef_data::Value> m_document;
    std::optional<mobdef_data::Value> m_original;
    std::optional<mobdef_data::Value> m_base;
    std::optional<mobdef_data::Value> m_preview;
    std::optional<std::filesystem::path> m_path;
    FileType m_file_type = FileType::Mob;
    bool m_modified = false;
    UndoHistory<mobdef_data::Value> m_history;
    StatusLog m_log;
};

} // namespace mobdef_editor
