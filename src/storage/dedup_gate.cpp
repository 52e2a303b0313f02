#include <relsync/storage/dedup_gate.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace relsync::storage {

namespace fs = std::filesystem;

fs::path destinationPath(const fs::path& saveDir, std::string_view fileName) {
    return saveDir / fs::path(std::string(fileName));
}

bool alreadyFetched(const fs::path& saveDir, std::string_view fileName) {
    const auto path = destinationPath(saveDir, fileName);
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
        spdlog::warn("Cannot check {}: {}", path.string(), ec.message());
        return false;
    }
    if (exists) {
        spdlog::debug("already fetched: {}", path.string());
    }
    return exists;
}

} // namespace relsync::storage
