/// @file defaults.cpp
/// @brief defaults.json reading and writing

#include <slate/content/defaults.hpp>
#include <slate/content/files.hpp>
#include <slate/content/strings.hpp>
#include <slate/core/log.hpp>

#include <system_error>

namespace slate_content {

namespace fs = std::filesystem;

slate_core::Result<Defaults> defaults_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return slate_core::Err<Defaults>(
            slate_core::Error(slate_core::ErrorCode::ParseError, "defaults.json must be an object"));
    }

    Defaults d;
    auto number = [&j](const char* key, double& out) -> bool {
        if (!j.contains(key)) return true;
        const auto& v = j[key];
        if (!v.is_number()) return false;
        out = v.get<double>();
        return true;
    };

    double width = d.design_width;
    double height = d.design_height;
    double transition = d.view_transition_ms;
    double steps = d.pixelate_steps;
    const std::pair<const char*, double*> fields[] = {
        {"designWidth", &width},
        {"designHeight", &height},
        {"viewTransitionMs", &transition},
        {"pixelateSteps", &steps},
    };
    for (const auto& [key, out] : fields) {
        if (!number(key, *out)) {
            return slate_core::Err<Defaults>(slate_core::Error(
                slate_core::ErrorCode::ParseError,
                std::string("defaults.json: '") + key + "' must be a number"));
        }
    }

    auto transition_ms = truncate_to_int(transition);
    auto pixelate_steps = truncate_to_int(steps);
    if (!transition_ms || !pixelate_steps) {
        return slate_core::Err<Defaults>(slate_core::Error(
            slate_core::ErrorCode::ParseError, "defaults.json: integer field out of range"));
    }

    d.design_width = width;
    d.design_height = height;
    d.view_transition_ms = *transition_ms;
    d.pixelate_steps = *pixelate_steps;
    return slate_core::Ok(d);
}

nlohmann::json defaults_to_json(const Defaults& defaults) {
    return nlohmann::json{
        {"designWidth", defaults.design_width},
        {"designHeight", defaults.design_height},
        {"viewTransitionMs", defaults.view_transition_ms},
        {"pixelateSteps", defaults.pixelate_steps},
    };
}

std::optional<Defaults> read_defaults_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    auto text = read_text_file(path);
    if (!text) {
        SLATE_LOG_WARN("{}: {}, using defaults", path.string(), text.error().message());
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded()) {
        SLATE_LOG_WARN("{}: malformed JSON, using defaults", path.string());
        return std::nullopt;
    }

    auto defaults = defaults_from_json(j);
    if (!defaults) {
        SLATE_LOG_WARN("{}: {}, using defaults", path.string(), defaults.error().message());
        return std::nullopt;
    }
    return *defaults;
}

Defaults load_defaults(const fs::path& presentation_dir) {
    return read_defaults_file(presentation_dir / "defaults.json").value_or(Defaults{});
}

slate_core::Result<void> save_defaults(const fs::path& presentation_dir, const Defaults& defaults) {
    return replace_file_atomically(presentation_dir / "defaults.json", defaults_to_json(defaults).dump(2) + "\n");
}

} // namespace slate_content
