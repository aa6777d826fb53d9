/// @file animation.cpp
/// @brief Animation overlay implementation

#include <slate/content/animation.hpp>
#include <slate/content/csv.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

namespace slate_content {

void split_from(const std::string& raw, AnimationSpec& spec) {
    std::string from = trim(raw);
    if (from.empty()) {
        return;
    }
    auto colon = from.find(':');
    if (colon == std::string::npos) {
        spec.from = from;
        return;
    }
    std::string dir = trim(std::string_view(from).substr(0, colon));
    std::string frac = trim(std::string_view(from).substr(colon + 1));
    if (!dir.empty()) {
        spec.from = dir;
    }
    if (!frac.empty()) {
        spec.border_frac = parse_number(frac);
    }
}

slate_core::Result<void> AnimationResolver::read(const CsvTable& table, const std::string& source) {
    for (std::size_t row = 0; row < table.row_count(); ++row) {
        std::string id = table.field(row, "id");
        if (id.empty()) {
            continue;
        }
        std::size_t line = table.line_of(row);

        std::string when = to_lower(table.field(row, "when"));
        std::string how = to_lower(table.field(row, "how"));
        if (how.empty()) how = "none";
        if (how == "none" || (when != "enter" && when != "exit")) {
            continue;
        }

        if (how == "direct") {
            return slate_core::Err(slate_core::ContentError::direct_animation(id).at(source, line));
        }
        auto kind = animation_kind_from_string(how);
        if (!kind) {
            return slate_core::Err(slate_core::ContentError::unsupported_animation(id, how).at(source, line));
        }

        AnimationSpec spec;
        spec.kind = *kind;

        for (const char* column : {"durationMs", "delayMs"}) {
            std::string raw = table.field(row, column);
            if (raw.empty()) continue;
            auto value = parse_number(raw);
            auto ms = value ? truncate_to_int(*value) : std::optional<int>{};
            if (!ms) {
                return slate_core::Err(slate_core::ContentError::bad_number(column, raw).at(source, line));
            }
            if (std::string_view(column) == "durationMs") spec.duration_ms = *ms;
            else spec.delay_ms = *ms;
        }

        split_from(table.field(row, "from"), spec);
        if (spec.kind != AnimationKind::Fade) {
            spec.border_frac.reset();
        }

        auto& entry = m_animations[id];
        if (when == "enter") {
            entry.appear = spec;
            m_cues.push_back(AnimationCue{id, CueWhen::Enter});
        } else {
            entry.disappear = spec;
            m_cues.push_back(AnimationCue{id, CueWhen::Exit});
        }
    }

    SLATE_LOG_DEBUG("{}: {} animation cues", source, m_cues.size());
    return slate_core::Ok();
}

void AnimationResolver::apply(std::vector<Node>& nodes) const {
    for (auto& node : nodes) {
        auto it = m_animations.find(node.id);
        if (it == m_animations.end()) {
            continue;
        }
        if (it->second.appear) node.appear = it->second.appear;
        if (it->second.disappear) node.disappear = it->second.disappear;
    }
}

} // namespace slate_content
