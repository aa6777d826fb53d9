#pragma once

/// @file types.hpp
/// @brief Scene graph produced by the content compiler

#include "fwd.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace slate_content {

// =============================================================================
// Enumerations
// =============================================================================

/// Coordinate space of a node
enum class Space : std::uint8_t {
    World,   // Placed in design-pixel world coordinates, seen through view cameras
    Screen,  // Anchored to the viewport, always visible
};

/// Node kinds known to the compiler
enum class NodeType : std::uint8_t {
    Text,
    Qr,
    Image,
    HtmlFrame,
    Bullets,
    Table,
    Group,
    Timer,
    Choices,
    Sound,
    Graph,
    Arrow,
    Line,
    Video,
};

[[nodiscard]] const char* space_name(Space space) noexcept;
[[nodiscard]] std::optional<Space> space_from_string(const std::string& str) noexcept;

/// Model type name ("text", "htmlFrame", ...)
[[nodiscard]] const char* node_type_name(NodeType type) noexcept;
[[nodiscard]] std::optional<NodeType> node_type_from_string(const std::string& str) noexcept;

// =============================================================================
// Geometry
// =============================================================================

/// Node box. World pixels for root nodes, parent-relative units when the node has a parent.
struct Transform {
    double x = 0.0;
    double y = 0.0;
    double w = 100.0;
    double h = 50.0;
    std::optional<double> rotation_deg;
    std::string anchor = "topLeft";
    std::optional<std::string> align;
    std::optional<std::string> v_align;
};

/// Optional background styling authored in the DSL
struct NodeStyle {
    std::optional<std::string> bg_color;
    std::optional<double> bg_alpha;
    std::optional<double> border_radius;

    [[nodiscard]] bool empty() const {
        return !bg_color && !bg_alpha && !border_radius;
    }
};

// =============================================================================
// Animation
// =============================================================================

enum class AnimationKind : std::uint8_t {
    Sudden,
    Fade,
    Pixelate,
    Appear,
};

[[nodiscard]] const char* animation_kind_name(AnimationKind kind) noexcept;
[[nodiscard]] std::optional<AnimationKind> animation_kind_from_string(const std::string& str) noexcept;

/// Enter or exit animation of one node
struct AnimationSpec {
    AnimationKind kind = AnimationKind::Sudden;
    std::optional<int> duration_ms;
    std::optional<int> delay_ms;
    std::optional<std::string> from;
    std::optional<double> border_frac;  // Fade only
};

enum class CueWhen : std::uint8_t {
    Enter,
    Exit,
};

/// Playback order entry
struct AnimationCue {
    std::string id;
    CueWhen when = CueWhen::Enter;

    bool operator==(const AnimationCue& other) const {
        return id == other.id && when == other.when;
    }
};

// =============================================================================
// Composites
// =============================================================================

/// One sub-element row of a composite geometries.csv (folder-local id)
struct CompositeGeometry {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    double w = 1.0;
    double h = 1.0;
    double rotation_deg = 0.0;
    std::string anchor = "topLeft";
    std::string align;
    std::string parent;
};

/// Sub-layout owned by a timer or choices node, backed by groups/<dir>/
struct Composite {
    std::string dir;
    /// Template after placeholder expansion
    std::optional<std::string> elements_text;
    /// Geometry tables keyed by sub-path ("" is the composite's own folder)
    std::map<std::string, std::vector<CompositeGeometry>> geometries;
};

// =============================================================================
// Node payloads
// =============================================================================

struct TextPayload {
    std::string text;
};

struct QrPayload {
    std::string url = "/join";
};

struct ImagePayload {
    std::string src;
};

struct HtmlFramePayload {
    std::string src;
};

struct BulletsPayload {
    std::vector<std::string> items;
    std::string style = "A";  // a, A, 1, X (roman), i, ., -
};

struct TablePayload {
    std::vector<std::vector<std::string>> rows;
    std::string delimiter = ";";
    std::optional<std::string> hstyle;
    std::optional<std::string> vstyle;
};

struct GroupPayload {};

struct TimerPayload {
    bool show_time = false;
    std::string bar_color = "orange";
    std::string line_color = "green";
    std::optional<double> line_width;
    std::string stat = "gaussian";
    std::optional<double> min_s;
    std::optional<double> max_s;
    std::optional<double> bin_size_s;
    /// Authored parameters except name, in authoring order
    std::vector<std::pair<std::string, std::string>> args;
    Composite composite;
};

struct ChoiceOption {
    std::string id;
    std::string label;
    std::string color;
};

struct ChoicesPayload {
    std::string question;
    std::vector<ChoiceOption> options;
    std::string chart = "pie";
    std::string bullets = "A";
    Composite composite;
};

/// Write-path kinds created by the editor
struct VideoPayload {
    std::string src;
};

struct SoundPayload {
    std::vector<std::pair<std::string, std::string>> params;
};

struct GraphPayload {
    std::vector<std::pair<std::string, std::string>> params;
};

struct ArrowPayload {
    std::string from = "(0,0)";
    std::string to = "(1,0)";
    std::string color = "white";
    std::optional<double> width;
};

struct LinePayload {
    std::string from = "(0,0)";
    std::string to = "(1,0)";
    std::string color = "white";
    std::optional<double> width;
};

/// std::monostate marks a node whose kind was never set
using NodePayload = std::variant<
    std::monostate,
    TextPayload,
    QrPayload,
    ImagePayload,
    HtmlFramePayload,
    BulletsPayload,
    TablePayload,
    GroupPayload,
    TimerPayload,
    ChoicesPayload,
    SoundPayload,
    GraphPayload,
    ArrowPayload,
    LinePayload,
    VideoPayload
>;

// =============================================================================
// Node
// =============================================================================

struct Node {
    std::string id;
    Space space = Space::World;
    Transform transform;
    std::optional<std::string> parent_id;
    std::optional<double> font_px;
    NodeStyle style;
    std::optional<AnimationSpec> appear;
    std::optional<AnimationSpec> disappear;
    bool visible = false;  // Derived at load time
    NodePayload payload;

    /// Kind of the payload; nullopt when unset
    [[nodiscard]] std::optional<NodeType> type() const;

    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&payload); }

    template<typename T>
    [[nodiscard]] T* as() { return std::get_if<T>(&payload); }
};

// =============================================================================
// Views
// =============================================================================

struct Camera {
    double cx = 0.0;
    double cy = 0.0;
    double zoom = 1.0;

    bool operator==(const Camera& other) const {
        return cx == other.cx && cy == other.cy && zoom == other.zoom;
    }
};

/// How a view camera was derived; re-emitted verbatim on save
struct CameraSpec {
    std::string ref_view;
    std::string loc;
    std::optional<std::string> duration_ms;
};

struct View {
    std::string id;
    Camera camera;
    std::vector<std::string> show;
    bool screen = false;
    std::optional<CameraSpec> camera_spec;
    std::optional<int> transition_ms;
};

// =============================================================================
// Presentation
// =============================================================================

/// Design frame and playback defaults (defaults.json)
struct Defaults {
    double design_width = 1920.0;
    double design_height = 1080.0;
    int view_transition_ms = 4000;
    int pixelate_steps = 20;
};

struct Presentation {
    std::string id = "default";
    std::string initial_view_id = "home";
    std::vector<View> views;
    std::vector<Node> nodes;
    std::vector<AnimationCue> animation_cues;
    Defaults defaults;

    [[nodiscard]] const Node* find_node(const std::string& node_id) const;
    [[nodiscard]] Node* find_node(const std::string& node_id);
    [[nodiscard]] const View* find_view(const std::string& view_id) const;

    /// First view whose show list contains the node
    [[nodiscard]] const View* owning_view(const std::string& node_id) const;
};

} // namespace slate_content
