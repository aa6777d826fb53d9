/// @file composite.cpp
/// @brief Composite folder materialization, loading and saving

#include <slate/content/composite.hpp>
#include <slate/content/csv.hpp>
#include <slate/content/files.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace slate_content {

namespace fs = std::filesystem;

// =============================================================================
// Names and templates
// =============================================================================

bool validate_folder_name(std::string_view name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    auto word = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };
    if (!word(name.front())) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(),
        [&word](char c) { return word(c) || c == '-'; });
}

slate_core::Result<std::vector<std::string>> split_composite_path(std::string_view path) {
    std::vector<std::string> parts;
    std::string current;
    auto flush = [&]() {
        std::string part = trim(current);
        if (!part.empty()) parts.push_back(std::move(part));
        current.clear();
    };
    for (char c : path) {
        if (c == '/' || c == '\\') flush();
        else current.push_back(c);
    }
    flush();

    if (parts.empty()) {
        return slate_core::Err<std::vector<std::string>>(
            slate_core::Error(slate_core::ErrorCode::InvalidArgument,
                              "Invalid composite path: '" + std::string(path) + "'"));
    }
    for (const auto& part : parts) {
        if (!validate_folder_name(part)) {
            return slate_core::Err<std::vector<std::string>>(
                slate_core::Error(slate_core::ErrorCode::InvalidArgument,
                                  "Invalid composite folder name: '" + part + "'"));
        }
    }
    return slate_core::Ok(std::move(parts));
}

std::string expand_placeholders(std::string_view text, const TemplateArgs& args) {
    auto ident_start = [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    };
    auto ident_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{' && i + 1 < text.size() && ident_start(text[i + 1])) {
            std::size_t j = i + 1;
            while (j < text.size() && ident_char(text[j])) ++j;
            if (j < text.size() && text[j] == '}') {
                std::string key(text.substr(i + 1, j - i - 1));
                auto it = args.find(key);
                if (it != args.end()) {
                    out += it->second;
                    i = j + 1;
                    continue;
                }
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

// =============================================================================
// Default files
// =============================================================================

namespace defaults {

std::string_view timer_elements() {
    static constexpr std::string_view text = R"TXT(# timer composite elements (draft)
# Delete the whole `groups/<name>/` folder to regenerate defaults.
# Args passed to timer[...] can be used as {arg} placeholders here.

# Default labels (editable in composite mode):
text[name=x_label]: Time (s)
text[name=y_label]: Procentage (%)

# Stats label (auto-updated via {{...}} binding, editable/positionable):
text[name=stats]: $\mu={{mean}}\,\mathrm{s}\quad \sigma={{sigma}}\,\mathrm{s}\quad \mathrm{count}={{count}}$

# Default arrows (editable in composite mode):
arrow[name=x_axis,from=(0,0),to=(1.05,0),color=white,width=0.006]
arrow[name=y_axis,from=(0,0),to=(0,1.05),color=white,width=0.006]
)TXT";
    return text;
}

std::string_view timer_geometries() {
    static constexpr std::string_view text =
        "id,view,x,y,w,h,rotationDeg,anchor,align\n"
        "x_label,timer,0.50,1.06,0.50,0.08,0,topCenter,center\n"
        "y_label,timer,-0.15627517456611062,0.05482153612994739,0.40,0.08,-90,centerRight,center\n"
        "stats,timer,0.5028738858079436,0.055646919385237144,0.70,0.08,0,topCenter,center\n"
        "x_axis,timer,0,0,1,1,0,topLeft,\n"
        "y_axis,timer,0,0,1,1,0,topLeft,\n";
    return text;
}

std::string_view timer_animations() {
    static constexpr std::string_view text = "id,when,how,from,durationMs,delayMs\n";
    return text;
}

std::string_view choices_elements() {
    static constexpr std::string_view text =
        "# choices composite elements (draft)\n"
        "# This composite controls the internal layout of the choices node.\n"
        "# Sub-ids used by the frontend: buttons, bullets, wheel\n";
    return text;
}

std::string_view choices_geometries() {
    static constexpr std::string_view text =
        "id,view,x,y,w,h,rotationDeg,anchor,align,parent\n"
        "bullets,composite,0.00,0.00,0.46,1.00,0,topLeft,left,\n"
        "wheel,composite,0.52,0.00,0.48,1.00,0,topLeft,center,\n";
    return text;
}

std::string_view choices_bullets_geometries() {
    static constexpr std::string_view text =
        "id,view,x,y,w,h,rotationDeg,anchor,align,parent\n"
        "buttons,composite,0.50,-0.10,1.00,0.18,0,topCenter,center,\n"
        "bullets,composite,0.00,0.00,1.00,1.00,0,topLeft,left,\n";
    return text;
}

std::string_view choices_wheel_geometries() {
    static constexpr std::string_view text =
        "id,view,x,y,w,h,rotationDeg,anchor,align,parent\n"
        "pie,composite,0.50,0.50,1.00,1.00,0,centerCenter,center,\n";
    return text;
}

} // namespace defaults

// =============================================================================
// CompositeMaterializer
// =============================================================================

namespace {

slate_core::Result<void> make_dirs(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return slate_core::Err(slate_core::ContentError::io_failure(dir.string(), ec.message()));
    }
    return slate_core::Ok();
}

/// Write each missing (path, content) pair; stops at the first failure
slate_core::Result<void> fill_missing(
    std::initializer_list<std::pair<fs::path, std::string_view>> files)
{
    for (const auto& [path, content] : files) {
        auto written = write_file_if_missing(path, content);
        if (!written) {
            return slate_core::Err(written.error());
        }
        if (*written) {
            SLATE_LOG_DEBUG("composite: wrote default {}", path.string());
        }
    }
    return slate_core::Ok();
}

} // anonymous namespace

CompositeMaterializer::CompositeMaterializer(fs::path presentation_dir)
    : m_dir(std::move(presentation_dir)) {}

slate_core::Result<bool> CompositeMaterializer::migrate_legacy(const std::string& name) {
    if (name == "groups") {
        return slate_core::Ok(false);
    }

    fs::path legacy = m_dir / name;
    fs::path target = groups_dir() / name;

    std::error_code ec;
    if (!fs::is_directory(legacy, ec) || fs::exists(target, ec)) {
        return slate_core::Ok(false);
    }

    fs::rename(legacy, target, ec);
    if (ec) {
        return slate_core::Err<bool>(slate_core::ContentError::io_failure(legacy.string(), ec.message()));
    }
    SLATE_LOG_INFO("composite: migrated {} to {}", legacy.string(), target.string());
    return slate_core::Ok(true);
}

slate_core::Result<fs::path> CompositeMaterializer::prepare(const std::string& name) {
    if (!validate_folder_name(name)) {
        return slate_core::Err<fs::path>(
            slate_core::Error(slate_core::ErrorCode::InvalidArgument,
                              "Invalid composite folder name: '" + name + "'"));
    }

    auto groups = make_dirs(groups_dir());
    if (!groups) {
        return slate_core::Err<fs::path>(groups.error());
    }

    auto migrated = migrate_legacy(name);
    if (!migrated) {
        SLATE_LOG_WARN("composite: legacy migration of '{}' failed: {}",
                       name, migrated.error().message());
    }

    fs::path folder = groups_dir() / name;
    auto made = make_dirs(folder);
    if (!made) {
        return slate_core::Err<fs::path>(made.error());
    }
    return slate_core::Ok(std::move(folder));
}

slate_core::Result<void> CompositeMaterializer::ensure_timer(const std::string& name) {
    auto folder = prepare(name);
    if (!folder) {
        return slate_core::Err(folder.error());
    }
    const fs::path& dir = *folder;
    return fill_missing({
        {dir / "elements.txt", defaults::timer_elements()},
        {dir / "geometries.csv", defaults::timer_geometries()},
        {dir / "animations.csv", defaults::timer_animations()},
    });
}

slate_core::Result<void> CompositeMaterializer::ensure_choices(const std::string& name) {
    auto folder = prepare(name);
    if (!folder) {
        return slate_core::Err(folder.error());
    }
    const fs::path& dir = *folder;
    for (const char* sub : {"bullets", "wheel"}) {
        auto made = make_dirs(dir / sub);
        if (!made) {
            return made;
        }
    }
    return fill_missing({
        {dir / "elements.txt", defaults::choices_elements()},
        {dir / "geometries.csv", defaults::choices_geometries()},
        {dir / "bullets" / "geometries.csv", defaults::choices_bullets_geometries()},
        {dir / "wheel" / "geometries.csv", defaults::choices_wheel_geometries()},
    });
}

// =============================================================================
// Loading
// =============================================================================

std::optional<std::string> read_composite_template(const fs::path& folder) {
    for (const char* file : {"elements.txt", "elements.pr"}) {
        fs::path path = folder / file;
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            continue;
        }
        auto text = read_text_file(path);
        if (!text) {
            SLATE_LOG_WARN("composite: cannot read template {}: {}", path.string(), text.error().message());
            return std::nullopt;
        }
        return std::move(*text);
    }
    return std::nullopt;
}

std::vector<CompositeGeometry> read_composite_geometries(
    const fs::path& csv_path, double default_w, double default_h)
{
    std::vector<CompositeGeometry> out;
    std::error_code ec;
    if (!fs::exists(csv_path, ec)) {
        return out;
    }

    auto table = CsvTable::read_file(csv_path);
    if (!table) {
        SLATE_LOG_WARN("composite: cannot read {}: {}", csv_path.string(), table.error().message());
        return out;
    }

    auto number = [&](std::size_t row, const char* column, double def) -> std::optional<double> {
        std::string raw = table->field(row, column);
        if (raw.empty()) return def;
        return parse_number(raw);
    };

    for (std::size_t row = 0; row < table->row_count(); ++row) {
        std::string id = table->field(row, "id");
        if (id.empty() || id.front() == '#') {
            continue;
        }

        auto x = number(row, "x", 0.0);
        auto y = number(row, "y", 0.0);
        auto w = number(row, "w", default_w);
        auto h = number(row, "h", default_h);
        auto rot = number(row, "rotationDeg", 0.0);
        if (!x || !y || !w || !h || !rot) {
            SLATE_LOG_WARN("composite: skipping unreadable row '{}' in {}", id, csv_path.string());
            continue;
        }

        CompositeGeometry g;
        g.id = id;
        g.x = *x;
        g.y = *y;
        g.w = *w;
        g.h = *h;
        g.rotation_deg = *rot;
        std::string anchor = table->field(row, "anchor");
        g.anchor = anchor.empty() ? "topLeft" : anchor;
        g.align = table->field(row, "align");
        g.parent = table->field(row, "parent");

        auto existing = std::find_if(out.begin(), out.end(),
            [&id](const CompositeGeometry& e) { return e.id == id; });
        if (existing != out.end()) {
            *existing = std::move(g);
        } else {
            out.push_back(std::move(g));
        }
    }
    return out;
}

Composite load_composite(
    const fs::path& presentation_dir,
    const std::string& composite_path,
    const std::vector<std::string>& sub_paths,
    const TemplateArgs* args)
{
    Composite composite;
    composite.dir = composite_path;

    fs::path folder = presentation_dir / "groups" / composite_path;
    if (auto tpl = read_composite_template(folder)) {
        composite.elements_text = args ? expand_placeholders(*tpl, *args) : std::move(*tpl);
    }

    for (const auto& sub : sub_paths) {
        fs::path csv_path = sub.empty() ? folder / "geometries.csv" : folder / sub / "geometries.csv";
        composite.geometries[sub] = read_composite_geometries(csv_path);
    }
    return composite;
}

// =============================================================================
// Saving
// =============================================================================

slate_core::Result<void> save_composite(
    const fs::path& presentation_dir,
    const std::string& composite_path,
    const std::vector<CompositeGeometry>& geometries,
    const std::optional<std::string>& elements_text,
    const std::optional<std::string>& elements_pr)
{
    auto parts = split_composite_path(composite_path);
    if (!parts) {
        return slate_core::Err(parts.error());
    }

    fs::path folder = presentation_dir / "groups";
    for (const auto& part : *parts) {
        folder /= part;
    }
    auto made = make_dirs(folder);
    if (!made) {
        return made;
    }

    if (elements_text) {
        auto written = replace_file_atomically(folder / "elements.txt", *elements_text);
        if (!written) return written;
    }
    if (elements_pr) {
        auto written = replace_file_atomically(folder / "elements.pr", *elements_pr);
        if (!written) return written;
    }

    CsvTable table(CsvTable::Record{"id", "view", "x", "y", "w", "h", "rotationDeg", "anchor", "align", "parent"});
    for (const auto& g : geometries) {
        table.add_row({
            g.id,
            "composite",
            format_number(g.x),
            format_number(g.y),
            format_number(g.w),
            format_number(g.h),
            format_number(g.rotation_deg),
            g.anchor,
            g.align,
            g.parent,
        });
    }

    auto written = replace_file_atomically(folder / "geometries.csv", table.to_string());
    if (!written) {
        return written;
    }
    SLATE_LOG_INFO("composite: saved {} ({} rows)", join(*parts, "/"), geometries.size());
    return slate_core::Ok();
}

} // namespace slate_content
