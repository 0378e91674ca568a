#include "discovery.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace conform::cli {

namespace {

auto is_excluded(const std::string& path, const std::vector<std::string>& exclude) -> bool {
    return std::any_of(exclude.begin(), exclude.end(), [&](const std::string& fragment) {
        return !fragment.empty() && path.find(fragment) != std::string::npos;
    });
}

} // namespace

auto discover_files(const std::vector<std::string>& paths, const std::vector<std::string>& exclude)
    -> Discovery {
    Discovery discovery;
    std::set<std::string> found;

    for (const auto& path : paths) {
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            CONFORM_LOG_ERROR("cli", "no such file or directory: " << path);
            discovery.errors.push_back(
                engine::io_error_result(path, "no such file or directory"));
            continue;
        }

        if (!fs::is_directory(status)) {
            found.insert(fs::path(path).lexically_normal().generic_string());
            continue;
        }

        size_t before = found.size();
        fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied,
                                            ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec) || entry.path().extension() != SOURCE_EXTENSION) {
                continue;
            }
            std::string file = entry.path().lexically_normal().generic_string();
            if (is_excluded(file, exclude)) {
                CONFORM_LOG_DEBUG("cli", "excluded " << file);
                continue;
            }
            found.insert(std::move(file));
        }
        if (ec) {
            CONFORM_LOG_ERROR("cli", "cannot read directory " << path << ": " << ec.message());
            discovery.errors.push_back(engine::io_error_result(
                path, "cannot read directory: " + ec.message()));
        }
        CONFORM_LOG_DEBUG("cli", path << ": " << found.size() - before << " source file(s)");
    }

    discovery.files.assign(found.begin(), found.end());
    return discovery;
}

} // namespace conform::cli
