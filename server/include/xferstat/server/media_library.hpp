#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "xferstat/error_codes.hpp"

namespace xferstat::server
{

    class LibraryError : public std::runtime_error
    {
    public:
        LibraryError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    struct MediaFile
    {
        std::filesystem::path path;
        // Relative to the library root, generic form.
        std::string relative;
        std::uint64_t size{};
    };

    // Read-only view of the media root that transfers are served from.
    class MediaLibrary
    {
    public:
        explicit MediaLibrary(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        // Path of a regular file below the root. A leading '/' is relative to the root.
        MediaFile resolve(const std::string &requested) const;

    private:
        std::filesystem::path sanitize(const std::string &requested) const;

        std::filesystem::path root_;
    };

} // namespace xferstat::server
