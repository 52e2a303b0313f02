#pragma once

#include <filesystem>
#include <string_view>

namespace relsync::storage {

/**
 * Destination path for an artifact inside the save directory.
 */
[[nodiscard]] std::filesystem::path destinationPath(const std::filesystem::path& saveDir,
                                                    std::string_view fileName);

/**
 * True when saveDir/fileName exists. Existence alone marks a release as fetched: no size or hash
 * verification is done, so a file left behind by an interrupted transfer also counts.
 * A filesystem error while checking is logged and reported as "not fetched".
 */
[[nodiscard]] bool alreadyFetched(const std::filesystem::path& saveDir, std::string_view fileName);

} // namespace relsync::storage
