#include "xferstat/server/media_library.hpp"

#include <utility>

namespace xferstat::server
{

    LibraryError::LibraryError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    MediaLibrary::MediaLibrary(std::filesystem::path root)
    {
        std::error_code ec;
        root_ = std::filesystem::canonical(root, ec);
        if (ec || !std::filesystem::is_directory(root_))
        {
            throw LibraryError(ErrorCode::NotFound, "Media root is not a directory: " + root.string());
        }
    }

    MediaFile MediaLibrary::resolve(const std::string &requested) const
    {
        const auto candidate = sanitize(requested);

        std::error_code ec;
        const auto resolved = std::filesystem::canonical(candidate, ec);
        if (ec)
        {
            throw LibraryError(ErrorCode::NotFound, "No such file: " + requested);
        }
        // Symlinks may point outside of the root.
        const auto relative = resolved.lexically_relative(root_);
        if (relative.empty() || *relative.begin() == "..")
        {
            throw LibraryError(ErrorCode::InvalidArgument, "Path escapes the media root: " + requested);
        }
        if (!std::filesystem::is_regular_file(resolved, ec))
        {
            throw LibraryError(ErrorCode::Unsupported, "Not a regular file: " + requested);
        }
        const auto size = std::filesystem::file_size(resolved, ec);
        if (ec)
        {
            throw LibraryError(ErrorCode::InternalError, "Cannot read size of " + requested + ": " + ec.message());
        }
        return MediaFile{
            .path = resolved,
            .relative = relative.generic_string(),
            .size = static_cast<std::uint64_t>(size),
        };
    }

    std::filesystem::path MediaLibrary::sanitize(const std::string &requested) const
    {
        if (requested.empty())
        {
            throw LibraryError(ErrorCode::InvalidArgument, "Empty path");
        }
        std::filesystem::path relative = requested;
        if (relative.is_absolute())
        {
            relative = relative.lexically_relative(relative.root_path());
        }

        auto sanitized = root_;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw LibraryError(ErrorCode::InvalidArgument, "Path traversal detected: " + requested);
            }
            sanitized /= part;
        }
        return sanitized;
    }

} // namespace xferstat::server
