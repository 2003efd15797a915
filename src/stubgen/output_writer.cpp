#include "stubgen/output_writer.hpp"

#include "log/log.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jstub::stubgen {

auto render_package_stub(const PackageStub& stub) -> std::string {
    std::string text;
    for (const auto& line : stub.imports) {
        text += line + "\n";
    }
    text += "\n\n";
    for (const auto& line : stub.lines) {
        text += line + "\n";
    }
    return text;
}

auto write_text_file(const fs::path& path, const std::string& text)
    -> Result<bool, GenerateError> {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return GenerateError{"cannot create directory: " + ec.message(),
                                 path.parent_path().string()};
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return GenerateError{"cannot open file for writing", path.string()};
    }
    file << text;
    file.close();
    if (!file) {
        return GenerateError{"write failed", path.string()};
    }
    JSTUB_LOG_TRACE("writer", "wrote " << text.size() << " bytes to " << path.string());
    return true;
}

} // namespace jstub::stubgen
