#pragma once

namespace uppy {

// Layout of the per-user configuration, relative to the profile directory
inline constexpr const char* CONFIG_SUBDIR = ".config";
inline constexpr const char* CONFIG_APP_DIR = "uppy";
inline constexpr const char* CONFIG_FILE_NAME = "config.json";

// Placeholder written into a freshly created config
inline constexpr const char* TEMPLATE_HOST = "https://";

inline constexpr const char* UPLOAD_ROUTE = "/api/upload";
inline constexpr const char* UPLOAD_FIELD_NAME = "file";

inline constexpr const char* STASH_SUFFIX = ".tmp";
inline constexpr size_t HASH_CHUNK_SIZE = 1024;

} // namespace uppy
