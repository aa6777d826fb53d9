#pragma once

/// @file composite.hpp
/// @brief Composite sub-layout folders (groups/<path>/) owned by timer and choices nodes

#include "types.hpp"

#include <slate/core/error.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slate_content {

/// Argument map for template expansion
using TemplateArgs = std::map<std::string, std::string>;

/// Folder-name token check: ^[A-Za-z0-9_][A-Za-z0-9_-]{0,63}$
[[nodiscard]] bool validate_folder_name(std::string_view name);

/// Split a composite path ("poll1/wheel") into validated segments
[[nodiscard]] slate_core::Result<std::vector<std::string>> split_composite_path(std::string_view path);

/// Replace {identifier} with args[identifier]; unknown keys are left as written
[[nodiscard]] std::string expand_placeholders(std::string_view text, const TemplateArgs& args);

// =============================================================================
// Default files
// =============================================================================

namespace defaults {

[[nodiscard]] std::string_view timer_elements();
[[nodiscard]] std::string_view timer_geometries();
[[nodiscard]] std::string_view timer_animations();

[[nodiscard]] std::string_view choices_elements();
[[nodiscard]] std::string_view choices_geometries();
[[nodiscard]] std::string_view choices_bullets_geometries();
[[nodiscard]] std::string_view choices_wheel_geometries();

} // namespace defaults

// =============================================================================
// CompositeMaterializer
// =============================================================================

/// Creates the backing folders of composite-owning nodes on demand.
///
/// Only missing files are written; existing files are never touched, so a
/// user who deletes a file (or the whole folder) gets the default back on the
/// next load.
class CompositeMaterializer {
public:
    explicit CompositeMaterializer(std::filesystem::path presentation_dir);

    /// groups/<name>/ with elements.txt, geometries.csv and animations.csv
    [[nodiscard]] slate_core::Result<void> ensure_timer(const std::string& name);

    /// groups/<name>/ with elements.txt, geometries.csv, bullets/ and wheel/
    [[nodiscard]] slate_core::Result<void> ensure_choices(const std::string& name);

    /// Move a flat <presentation>/<name>/ folder to groups/<name>/ when the
    /// target does not exist. Returns true when a folder was moved.
    [[nodiscard]] slate_core::Result<bool> migrate_legacy(const std::string& name);

    [[nodiscard]] const std::filesystem::path& presentation_dir() const noexcept { return m_dir; }
    [[nodiscard]] std::filesystem::path groups_dir() const { return m_dir / "groups"; }

private:
    [[nodiscard]] slate_core::Result<std::filesystem::path> prepare(const std::string& name);

    std::filesystem::path m_dir;
};

// =============================================================================
// Reading and writing composites
// =============================================================================

/// Template of a composite folder: elements.txt, else elements.pr
[[nodiscard]] std::optional<std::string> read_composite_template(const std::filesystem::path& folder);

/// Rows of a composite geometries.csv. Absent file or unreadable rows are skipped.
[[nodiscard]] std::vector<CompositeGeometry> read_composite_geometries(
    const std::filesystem::path& csv_path, double default_w = 1.0, double default_h = 1.0);

/// Load groups/<composite_path>/ with the geometry tables of `sub_paths`
/// ("" is the folder itself). The template is expanded when `args` is given.
[[nodiscard]] Composite load_composite(
    const std::filesystem::path& presentation_dir,
    const std::string& composite_path,
    const std::vector<std::string>& sub_paths,
    const TemplateArgs* args = nullptr);

/// Editor save of one composite folder
[[nodiscard]] slate_core::Result<void> save_composite(
    const std::filesystem::path& presentation_dir,
    const std::string& composite_path,
    const std::vector<CompositeGeometry>& geometries,
    const std::optional<std::string>& elements_text = std::nullopt,
    const std::optional<std::string>& elements_pr = std::nullopt);

} // namespace slate_content
