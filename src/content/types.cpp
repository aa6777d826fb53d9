/// @file types.cpp
/// @brief Scene graph helpers

#include <slate/content/types.hpp>

#include <algorithm>
#include <type_traits>

namespace slate_content {

// =============================================================================
// Name tables
// =============================================================================

const char* space_name(Space space) noexcept {
    switch (space) {
        case Space::World:  return "world";
        case Space::Screen: return "screen";
    }
    return "world";
}

std::optional<Space> space_from_string(const std::string& str) noexcept {
    if (str == "world") return Space::World;
    if (str == "screen") return Space::Screen;
    return std::nullopt;
}

const char* node_type_name(NodeType type) noexcept {
    switch (type) {
        case NodeType::Text:      return "text";
        case NodeType::Qr:        return "qr";
        case NodeType::Image:     return "image";
        case NodeType::HtmlFrame: return "htmlFrame";
        case NodeType::Bullets:   return "bullets";
        case NodeType::Table:     return "table";
        case NodeType::Group:     return "group";
        case NodeType::Timer:     return "timer";
        case NodeType::Choices:   return "choices";
        case NodeType::Sound:     return "sound";
        case NodeType::Graph:     return "graph";
        case NodeType::Arrow:     return "arrow";
        case NodeType::Line:      return "line";
        case NodeType::Video:     return "video";
    }
    return "unknown";
}

std::optional<NodeType> node_type_from_string(const std::string& str) noexcept {
    static constexpr NodeType all[] = {
        NodeType::Text, NodeType::Qr, NodeType::Image, NodeType::HtmlFrame,
        NodeType::Bullets, NodeType::Table, NodeType::Group, NodeType::Timer,
        NodeType::Choices, NodeType::Sound, NodeType::Graph, NodeType::Arrow,
        NodeType::Line, NodeType::Video,
    };
    for (NodeType type : all) {
        if (str == node_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char* animation_kind_name(AnimationKind kind) noexcept {
    switch (kind) {
        case AnimationKind::Sudden:   return "sudden";
        case AnimationKind::Fade:     return "fade";
        case AnimationKind::Pixelate: return "pixelate";
        case AnimationKind::Appear:   return "appear";
    }
    return "sudden";
}

std::optional<AnimationKind> animation_kind_from_string(const std::string& str) noexcept {
    if (str == "sudden") return AnimationKind::Sudden;
    if (str == "fade") return AnimationKind::Fade;
    if (str == "pixelate") return AnimationKind::Pixelate;
    if (str == "appear") return AnimationKind::Appear;
    return std::nullopt;
}

// =============================================================================
// Node
// =============================================================================

std::optional<NodeType> Node::type() const {
    return std::visit([](const auto& p) -> std::optional<NodeType> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, TextPayload>) return NodeType::Text;
        else if constexpr (std::is_same_v<T, QrPayload>) return NodeType::Qr;
        else if constexpr (std::is_same_v<T, ImagePayload>) return NodeType::Image;
        else if constexpr (std::is_same_v<T, HtmlFramePayload>) return NodeType::HtmlFrame;
        else if constexpr (std::is_same_v<T, BulletsPayload>) return NodeType::Bullets;
        else if constexpr (std::is_same_v<T, TablePayload>) return NodeType::Table;
        else if constexpr (std::is_same_v<T, GroupPayload>) return NodeType::Group;
        else if constexpr (std::is_same_v<T, TimerPayload>) return NodeType::Timer;
        else if constexpr (std::is_same_v<T, ChoicesPayload>) return NodeType::Choices;
        else if constexpr (std::is_same_v<T, SoundPayload>) return NodeType::Sound;
        else if constexpr (std::is_same_v<T, GraphPayload>) return NodeType::Graph;
        else if constexpr (std::is_same_v<T, ArrowPayload>) return NodeType::Arrow;
        else if constexpr (std::is_same_v<T, LinePayload>) return NodeType::Line;
        else if constexpr (std::is_same_v<T, VideoPayload>) return NodeType::Video;
        else return std::nullopt;
    }, payload);
}

// =============================================================================
// Presentation
// =============================================================================

const Node* Presentation::find_node(const std::string& node_id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
        [&node_id](const Node& n) { return n.id == node_id; });
    return it != nodes.end() ? &*it : nullptr;
}

Node* Presentation::find_node(const std::string& node_id) {
    auto it = std::find_if(nodes.begin(), nodes.end(),
        [&node_id](const Node& n) { return n.id == node_id; });
    return it != nodes.end() ? &*it : nullptr;
}

const View* Presentation::find_view(const std::string& view_id) const {
    auto it = std::find_if(views.begin(), views.end(),
        [&view_id](const View& v) { return v.id == view_id; });
    return it != views.end() ? &*it : nullptr;
}

const View* Presentation::owning_view(const std::string& node_id) const {
    for (const auto& view : views) {
        if (std::find(view.show.begin(), view.show.end(), node_id) != view.show.end()) {
            return &view;
        }
    }
    return nullptr;
}

} // namespace slate_content
