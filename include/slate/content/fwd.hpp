#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for slate_content module

#include <cstdint>

namespace slate_content {

// Scene graph
enum class Space : std::uint8_t;
enum class NodeType : std::uint8_t;
enum class AnimationKind : std::uint8_t;
enum class CueWhen : std::uint8_t;
struct Transform;
struct NodeStyle;
struct AnimationSpec;
struct AnimationCue;
struct CompositeGeometry;
struct Composite;
struct Node;
struct Camera;
struct CameraSpec;
struct View;
struct Defaults;
struct Presentation;

// Tokenizer
class ParamMap;
struct HeaderLine;

// Compiler stages
class ViewResolver;
class DslParser;
struct ParsedDocument;
class CsvTable;
class GeometryResolver;
class CompositeMaterializer;
class AnimationResolver;
class ContentSerializer;

} // namespace slate_content
