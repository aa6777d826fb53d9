/// @file files.cpp
/// @brief File access helpers

#include <slate/content/files.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace slate_content {

namespace fs = std::filesystem;

slate_core::Result<std::string> read_text_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return slate_core::Err<std::string>(slate_core::ContentError::missing_file(path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return slate_core::Err<std::string>(
            slate_core::ContentError::io_failure(path.string(), "cannot open for reading"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return slate_core::Err<std::string>(
            slate_core::ContentError::io_failure(path.string(), "read failed"));
    }

    std::string text = buffer.str();
    // UTF-8 byte order mark
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    return slate_core::Ok(std::move(text));
}

slate_core::Result<void> write_text_file(const fs::path& path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return slate_core::Err(slate_core::ContentError::io_failure(path.string(), ec.message()));
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return slate_core::Err(slate_core::ContentError::io_failure(path.string(), "cannot open for writing"));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (file.fail()) {
        return slate_core::Err(slate_core::ContentError::io_failure(path.string(), "write failed"));
    }
    return slate_core::Ok();
}

slate_core::Result<void> replace_file_atomically(const fs::path& path, std::string_view content) {
    fs::path tmp = path;
    tmp += ".tmp";

    auto written = write_text_file(tmp, content);
    if (!written) {
        return written;
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return slate_core::Err(slate_core::ContentError::io_failure(path.string(), ec.message()));
    }
    return slate_core::Ok();
}

slate_core::Result<bool> write_file_if_missing(const fs::path& path, std::string_view content) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return slate_core::Ok(false);
    }
    auto written = write_text_file(path, content);
    if (!written) {
        return slate_core::Err<bool>(written.error());
    }
    return slate_core::Ok(true);
}

} // namespace slate_content
