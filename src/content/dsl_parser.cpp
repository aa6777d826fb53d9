/// @file dsl_parser.cpp
/// @brief Presentation DSL parser implementation

#include <slate/content/dsl_parser.hpp>
#include <slate/content/camera.hpp>
#include <slate/content/composite.hpp>
#include <slate/content/files.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <system_error>

namespace slate_content {

namespace fs = std::filesystem;

// =============================================================================
// Block helpers
// =============================================================================

std::string slugify(std::string_view label) {
    std::string trimmed = trim(label);
    std::string out;
    bool in_space = false;
    for (char c : trimmed) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) out.push_back('_');
            in_space = true;
            continue;
        }
        in_space = false;
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            out.push_back(c);
        }
    }
    return out.empty() ? "option" : out;
}

std::vector<ChoiceOption> parse_choice_options(std::string_view raw) {
    std::string s = trim(raw);
    // Strip enclosing {..} / [..] layers, including doubled braces
    while (s.size() >= 2 && (s.front() == '{' || s.front() == '[') && (s.back() == '}' || s.back() == ']')) {
        s = trim(std::string_view(s).substr(1, s.size() - 2));
    }

    std::vector<ChoiceOption> options;
    std::set<std::string> seen;
    auto parts = split_top_level(s, false);

    for (std::size_t idx = 0; idx < parts.size(); ++idx) {
        const std::string& part = parts[idx];
        if (part.empty()) continue;

        std::string label;
        std::string color;
        auto colon = part.find(':');
        if (colon != std::string::npos) {
            label = trim(std::string_view(part).substr(0, colon));
            color = trim(std::string_view(part).substr(colon + 1));
        } else {
            label = trim(part);
        }
        if (label.empty()) continue;
        if (color.empty()) {
            color = k_choice_palette[idx % k_choice_palette.size()];
        }

        std::string base = slugify(label);
        std::string id = base;
        for (int n = 2; seen.count(id) > 0; ++n) {
            id = base + std::to_string(n);
        }
        seen.insert(id);
        options.push_back(ChoiceOption{id, label, color});
    }
    return options;
}

bool parse_flag(std::string_view value) {
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

slate_core::Result<void> validate_timer_bins(
    const std::string& id,
    std::optional<double> min_s,
    std::optional<double> max_s,
    std::optional<double> bin_size_s)
{
    if (!min_s || !max_s || !bin_size_s) {
        return slate_core::Ok();
    }
    double span = *max_s - *min_s;
    double bin = *bin_size_s;
    if (!std::isfinite(*min_s) || !std::isfinite(*max_s) || !std::isfinite(bin) || bin <= 0.0) {
        return slate_core::Err(slate_core::ContentError::incompatible_timer_bins(id, span, bin));
    }
    double bins = span / bin;
    constexpr double tolerance = 1e-6;
    if (!std::isfinite(bins) || bins < -tolerance || std::abs(bins - std::round(bins)) > tolerance) {
        return slate_core::Err(slate_core::ContentError::incompatible_timer_bins(id, span, bin));
    }
    return slate_core::Ok();
}

std::string strip_list_marker(std::string_view item) {
    std::string s = trim(item);
    if (s.size() >= 2 && (s[0] == '-' || s[0] == '*' || s[0] == '+')
        && std::isspace(static_cast<unsigned char>(s[1]))) {
        return trim(std::string_view(s).substr(1));
    }
    return s;
}

// =============================================================================
// Parser context
// =============================================================================

namespace {

/// Everything one parse needs; nothing survives past parse()
struct ParserContext {
    const ParseOptions& options;
    std::vector<std::string> lines;
    std::size_t pos = 0;  // Next line to read (0-based)

    ViewResolver resolver;
    ParsedDocument doc;
    std::optional<std::size_t> current_view;
    bool has_world_view = false;
    std::set<std::string> node_ids;
    std::optional<CompositeMaterializer> composites;

    explicit ParserContext(const ParseOptions& opts)
        : options(opts), resolver(opts.defaults) {
        if (opts.presentation_dir) {
            composites.emplace(*opts.presentation_dir);
        }
    }

    [[nodiscard]] View& view() { return doc.views[*current_view]; }
    [[nodiscard]] bool screen_mode() const { return current_view && doc.views[*current_view].screen; }
};

/// Attach a source location to a content error that has none yet
slate_core::Error located(const slate_core::Error& err, const std::string& source, std::size_t line) {
    if (const auto* content = err.as<slate_core::ContentError>()) {
        slate_core::ContentError copy = *content;
        if (copy.line == 0) {
            copy.at(source, line);
        }
        return slate_core::Error(std::move(copy));
    }
    return err;
}

/// Block body: inline content as the first line, then lines until the next header.
/// Blank and comment lines are kept.
std::vector<std::string> read_body(ParserContext& ctx, const HeaderLine& header) {
    std::vector<std::string> body;
    if (!header.inline_text.empty()) {
        body.push_back(header.inline_text);
    }
    if (!header.has_colon) {
        return body;
    }
    while (ctx.pos < ctx.lines.size()) {
        const std::string& line = ctx.lines[ctx.pos];
        std::string peek = trim(line);
        if (!peek.empty() && peek.front() != '#' && is_header_line(peek)) {
            break;
        }
        body.push_back(line);
        ++ctx.pos;
    }
    return body;
}

/// Drop empty lines at both ends
void trim_outer_empty(std::vector<std::string>& lines) {
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    auto first = std::find_if(lines.begin(), lines.end(), [](const std::string& l) { return !l.empty(); });
    lines.erase(lines.begin(), first);
}

std::vector<std::string> split_on(std::string_view line, std::string_view delim) {
    std::vector<std::string> cells;
    std::size_t start = 0;
    while (true) {
        auto at = line.find(delim, start);
        if (at == std::string_view::npos) {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, at - start)));
        start = at + delim.size();
    }
    return cells;
}

void apply_style(Node& node, const ParamMap& params) {
    if (auto bg = params.first_of({"bgColor", "bg"})) {
        node.style.bg_color = *bg;
    }
    if (auto alpha = params.first_of({"bgAlpha"})) {
        node.style.bg_alpha = parse_number(*alpha);
    }
    if (auto radius = params.first_of({"borderRadius", "rounded"})) {
        node.style.border_radius = parse_number(*radius);
    }
}

/// Register a node in the current view
slate_core::Result<void> add_node(ParserContext& ctx, Node node, const HeaderLine& header, std::size_t line_no) {
    if (!ctx.current_view) {
        return slate_core::Err(slate_core::ContentError::outside_view(header.raw).at(ctx.options.source, line_no));
    }
    if (!ctx.node_ids.insert(node.id).second) {
        return slate_core::Err(
            slate_core::ContentError::duplicate_node(node.id, header.raw).at(ctx.options.source, line_no));
    }
    if (ctx.screen_mode()) {
        node.space = Space::Screen;
    }
    apply_style(node, header.params);
    ctx.view().show.push_back(node.id);
    SLATE_LOG_TRACE("{}:{}: {} '{}' in view '{}'", ctx.options.source, line_no,
                    header.keyword, node.id, ctx.view().id);
    ctx.doc.nodes.push_back(std::move(node));
    return slate_core::Ok();
}

Node make_node(const HeaderLine& header, NodePayload payload) {
    Node node;
    node.id = header.params.get_or("name", "");
    node.payload = std::move(payload);
    return node;
}

// =============================================================================
// View handlers
// =============================================================================

using Handler = slate_core::Result<void> (*)(ParserContext&, const HeaderLine&, std::size_t);

std::optional<std::size_t> find_view_index(const ParserContext& ctx, const std::string& id) {
    for (std::size_t i = 0; i < ctx.doc.views.size(); ++i) {
        if (ctx.doc.views[i].id == id) return i;
    }
    return std::nullopt;
}

slate_core::Result<void> handle_view(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    std::string name = header.params.get_or("name", "");

    if (auto existing = find_view_index(ctx, name); existing && ctx.doc.views[*existing].screen) {
        ctx.current_view = existing;
        return slate_core::Ok();
    }

    auto resolved = ctx.resolver.resolve(header.params);
    if (!resolved) {
        return slate_core::Err(located(resolved.error(), ctx.options.source, line_no));
    }

    if (resolved->revisit) {
        ctx.current_view = find_view_index(ctx, name);
        return slate_core::Ok();
    }

    View view;
    view.id = name;
    view.camera = resolved->camera;
    view.camera_spec = resolved->spec;
    view.transition_ms = resolved->transition_ms;
    ctx.doc.views.push_back(std::move(view));
    ctx.current_view = ctx.doc.views.size() - 1;

    if (!ctx.has_world_view) {
        ctx.doc.initial_view_id = name;
        ctx.has_world_view = true;
    }
    return slate_core::Ok();
}

slate_core::Result<void> handle_screen(ParserContext& ctx, const HeaderLine& header, std::size_t /*line_no*/) {
    std::string name = header.params.get_or("name", "");
    if (auto existing = find_view_index(ctx, name)) {
        ctx.current_view = existing;
        return slate_core::Ok();
    }

    View view;
    view.id = name;
    view.screen = true;
    ctx.doc.views.push_back(std::move(view));
    ctx.current_view = ctx.doc.views.size() - 1;
    return slate_core::Ok();
}

// =============================================================================
// Node handlers
// =============================================================================

slate_core::Result<void> handle_text(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    auto body = read_body(ctx, header);
    trim_outer_empty(body);
    return add_node(ctx, make_node(header, TextPayload{join(body, "\n")}), header, line_no);
}

slate_core::Result<void> handle_qr(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    QrPayload qr;
    qr.url = header.params.get_or("url", "/join");
    return add_node(ctx, make_node(header, std::move(qr)), header, line_no);
}

slate_core::Result<void> handle_image(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    std::string name = header.params.get_or("name", "");
    ImagePayload image;
    image.src = header.params.first_of({"src", "file"}).value_or("/media/" + name + ".png");

    Node node = make_node(header, std::move(image));
    if (header.params.get_or("space", "world") == "screen") {
        node.space = Space::Screen;
    }
    return add_node(ctx, std::move(node), header, line_no);
}

slate_core::Result<void> handle_iframe(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    auto src = header.params.first_of({"src"});
    if (!src) {
        return slate_core::Err(
            slate_core::ContentError::iframe_without_src(header.raw).at(ctx.options.source, line_no));
    }
    return add_node(ctx, make_node(header, HtmlFramePayload{*src}), header, line_no);
}

slate_core::Result<void> handle_bullets(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    BulletsPayload bullets;
    for (const auto& line : read_body(ctx, header)) {
        std::string item = trim(line);
        if (item.empty() || item.front() == '#') continue;
        bullets.items.push_back(strip_list_marker(item));
    }
    bullets.style = header.params.first_of({"type", "bullets"}).value_or("A");
    if (bullets.style == "I") {
        bullets.style = "X";
    }
    return add_node(ctx, make_node(header, std::move(bullets)), header, line_no);
}

slate_core::Result<void> handle_table(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    TablePayload table;
    auto delim = header.params.get("delim");
    if (delim && !delim->empty()) {
        table.delimiter = *delim;
    }
    table.hstyle = header.params.first_of({"hstyle"});
    table.vstyle = header.params.first_of({"vstyle"});

    auto body = read_body(ctx, header);
    trim_outer_empty(body);
    for (const auto& line : body) {
        table.rows.push_back(split_on(line, table.delimiter));
    }
    return add_node(ctx, make_node(header, std::move(table)), header, line_no);
}

slate_core::Result<void> handle_group(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    return add_node(ctx, make_node(header, GroupPayload{}), header, line_no);
}

/// Create the composite folder when needed and read it back; failures only warn
Composite materialize(ParserContext& ctx, const std::string& name, bool choices,
                      const TemplateArgs& args)
{
    Composite composite;
    composite.dir = name;
    if (!ctx.composites) {
        return composite;
    }

    auto ensured = choices ? ctx.composites->ensure_choices(name) : ctx.composites->ensure_timer(name);
    if (!ensured) {
        SLATE_LOG_WARN("composite '{}' unavailable: {}", name, ensured.error().message());
        if (!validate_folder_name(name)) {
            return composite;
        }
    }

    std::vector<std::string> sub_paths = choices
        ? std::vector<std::string>{"", "bullets", "wheel"}
        : std::vector<std::string>{""};
    return load_composite(ctx.composites->presentation_dir(), name, sub_paths, &args);
}

slate_core::Result<void> handle_timer(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    const auto& params = header.params;
    std::string name = params.get_or("name", "");

    auto number = [&params](const char* key) -> std::optional<double> {
        auto raw = params.first_of({key});
        return raw ? parse_number(*raw) : std::nullopt;
    };

    TimerPayload timer;
    timer.show_time = parse_flag(params.get_or("showTime", "0"));
    timer.bar_color = params.get_or("barColor", "orange");
    timer.line_color = params.get_or("lineColor", "green");
    timer.line_width = number("lineWidth");
    timer.stat = params.get_or("stat", "gaussian");
    timer.min_s = number("min");
    timer.max_s = number("max");
    timer.bin_size_s = number("binSize");

    auto bins = validate_timer_bins(name, timer.min_s, timer.max_s, timer.bin_size_s);
    if (!bins) {
        return slate_core::Err(located(bins.error(), ctx.options.source, line_no));
    }

    for (const auto& [key, value] : params) {
        if (key != "name") {
            timer.args.emplace_back(key, value);
        }
    }

    if (!ctx.current_view) {
        return slate_core::Err(slate_core::ContentError::outside_view(header.raw).at(ctx.options.source, line_no));
    }

    TemplateArgs args(timer.args.begin(), timer.args.end());
    auto set_number = [&args](const char* key, const std::optional<double>& value) {
        if (value) args[key] = format_number(*value);
    };
    args["showTime"] = timer.show_time ? "1" : "0";
    args["barColor"] = timer.bar_color;
    args["lineColor"] = timer.line_color;
    args["stat"] = timer.stat;
    set_number("lineWidth", timer.line_width);
    set_number("min", timer.min_s);
    set_number("max", timer.max_s);
    set_number("binSize", timer.bin_size_s);

    if (ctx.node_ids.count(name) == 0) {
        timer.composite = materialize(ctx, name, false, args);
    }
    return add_node(ctx, make_node(header, std::move(timer)), header, line_no);
}

slate_core::Result<void> handle_choices(ParserContext& ctx, const HeaderLine& header, std::size_t line_no) {
    const auto& params = header.params;
    std::string name = params.get_or("name", "");

    auto body = read_body(ctx, header);
    trim_outer_empty(body);

    ChoicesPayload choices;
    choices.question = join(body, "\n");
    choices.chart = "pie";
    choices.bullets = params.get_or("bullets", "A");
    if (auto raw = params.get("choices")) {
        choices.options = parse_choice_options(*raw);
    }

    if (!ctx.current_view) {
        return slate_core::Err(slate_core::ContentError::outside_view(header.raw).at(ctx.options.source, line_no));
    }

    TemplateArgs args;
    for (const auto& [key, value] : params) {
        if (key != "name") args[key] = value;
    }
    if (ctx.node_ids.count(name) == 0) {
        choices.composite = materialize(ctx, name, true, args);
    }
    return add_node(ctx, make_node(header, std::move(choices)), header, line_no);
}

const std::map<std::string, Handler>& handlers() {
    static const std::map<std::string, Handler> table = {
        {"view", &handle_view},
        {"screen", &handle_screen},
        {"text", &handle_text},
        {"qr", &handle_qr},
        {"image", &handle_image},
        {"iframe", &handle_iframe},
        {"bullets", &handle_bullets},
        {"table", &handle_table},
        {"group", &handle_group},
        {"timer", &handle_timer},
        {"choices", &handle_choices},
    };
    return table;
}

} // anonymous namespace

// =============================================================================
// DslParser
// =============================================================================

DslParser::DslParser(ParseOptions options)
    : m_options(std::move(options)) {}

slate_core::Result<ParsedDocument> DslParser::parse(std::string_view text) const {
    ParserContext ctx(m_options);
    ctx.lines = split_lines(text);

    while (ctx.pos < ctx.lines.size()) {
        std::size_t line_no = ctx.pos + 1;
        const std::string raw = ctx.lines[ctx.pos++];
        std::string stripped = trim(raw);
        if (stripped.empty() || stripped.front() == '#') {
            continue;
        }

        auto header = parse_header(raw, m_options.source, line_no);
        if (!header) {
            return slate_core::Err<ParsedDocument>(header.error());
        }

        const auto& table = handlers();
        auto it = table.find(header->keyword);
        if (it == table.end()) {
            return slate_core::Err<ParsedDocument>(
                slate_core::ContentError::unknown_keyword(header->keyword, raw).at(m_options.source, line_no));
        }

        auto handled = it->second(ctx, *header, line_no);
        if (!handled) {
            return slate_core::Err<ParsedDocument>(handled.error());
        }
    }

    if (ctx.doc.views.empty()) {
        View home;
        home.id = "home";
        ctx.doc.views.push_back(std::move(home));
        ctx.doc.initial_view_id = "home";
    }

    SLATE_LOG_DEBUG("{}: {} views, {} nodes", m_options.source, ctx.doc.views.size(), ctx.doc.nodes.size());
    return slate_core::Ok(std::move(ctx.doc));
}

slate_core::Result<ParsedDocument> DslParser::parse_file(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        SLATE_LOG_WARN("no presentation file at {}", path.string());
        return parse("");
    }

    auto text = read_text_file(path);
    if (!text) {
        return slate_core::Err<ParsedDocument>(text.error());
    }

    ParseOptions options = m_options;
    options.source = path.string();
    return DslParser(std::move(options)).parse(*text);
}

} // namespace slate_content
