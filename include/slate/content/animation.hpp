#pragma once

/// @file animation.hpp
/// @brief animations.csv overlay: enter/exit animations and the cue order
///
/// Columns: id,when,how,from,durationMs,delayMs

#include "types.hpp"

#include <slate/core/error.hpp>

#include <map>
#include <string>
#include <vector>

namespace slate_content {

class CsvTable;

inline constexpr const char* k_animation_columns[] = {
    "id", "when", "how", "from", "durationMs", "delayMs",
};

/// Split a `from` cell: "left:0.2" -> ("left", 0.2). A fraction that is not a
/// number is dropped; empty parts are omitted.
void split_from(const std::string& raw, AnimationSpec& spec);

class AnimationResolver {
public:
    /// Per-node animations read from the table
    struct NodeAnimations {
        std::optional<AnimationSpec> appear;
        std::optional<AnimationSpec> disappear;
    };

    AnimationResolver() = default;

    /// Read every row. Rows with how=none or an unknown `when` are dropped.
    [[nodiscard]] slate_core::Result<void> read(const CsvTable& table, const std::string& source = "animations.csv");

    /// Copy the animations onto matching nodes
    void apply(std::vector<Node>& nodes) const;

    [[nodiscard]] const std::map<std::string, NodeAnimations>& animations() const noexcept { return m_animations; }
    [[nodiscard]] const std::vector<AnimationCue>& cues() const noexcept { return m_cues; }

private:
    std::map<std::string, NodeAnimations> m_animations;
    std::vector<AnimationCue> m_cues;
};

} // namespace slate_content
