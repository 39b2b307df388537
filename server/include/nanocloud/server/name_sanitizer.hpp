#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace nanocloud::server
{

    enum class EmptyNamePolicy
    {
        // An unusable name is reported as "" and the caller must reject it.
        Reject,
        // An unusable name becomes "file_<unix-seconds>".
        TimestampDefault
    };

    // Replaces separators and every character outside
    // [A-Za-z0-9._ -()[]+] with '_', then trims. Returns "" when the result is
    // empty, "." or "..".
    std::string sanitize_segment(std::string_view raw);

    // Sanitizes the last path component of `raw`.
    std::string sanitize_filename(std::string_view raw, EmptyNamePolicy policy,
                                  std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Sanitizes a folder-upload sub-path: folder segments through
    // sanitize_segment (unusable ones are dropped), the final segment through
    // sanitize_filename. Under Reject, an unusable final segment (including
    // one left empty by a trailing separator) makes the whole result "".
    std::string sanitize_relative_path(std::string_view raw, EmptyNamePolicy policy);

    // The name a file will be stored under inside the target directory:
    // `relative_path` when given, otherwise `filename`.
    std::string sanitize_upload_name(std::string_view relative_path, std::string_view filename,
                                     EmptyNamePolicy policy);

} // namespace nanocloud::server
