#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace strata::consts {

// Repository layout
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kPayloadsDir = "payloads";
inline constexpr std::string_view kTagsDir     = "tags";
inline constexpr std::string_view kRendersDir  = "renders";
inline constexpr std::string_view kVersionFile = "VERSION";
inline constexpr std::string_view kRepoVersion = "1";

// Tag streams
inline constexpr std::string_view kTagExt  = ".tag";
inline constexpr std::string_view kLockExt = ".lock";
inline constexpr char kTagVersionSep = '~';

// Runtime layout
inline constexpr std::string_view kUpperDir   = "upper";
inline constexpr std::string_view kWorkDir    = "work";
inline constexpr std::string_view kStatusFile = "status";

// EnvSpec
inline constexpr char kEnvSpecSep = '+';

// ——— Digest sizes ———
inline constexpr std::size_t kDigestSize       = 32; // SHA-256
inline constexpr std::size_t kDigestBase32Len  = 52; // RFC 4648, no padding

// ——— Store fanout ———
inline constexpr std::size_t kFanoutLen = 2; // "AB/" + "CDEF..." under objects/ and payloads/

// ——— Streaming ———
inline constexpr std::size_t kChunkSize = 4096;

// ——— Binary object encoding ———
inline constexpr std::string_view kObjectHeader = "--STRATA--";
inline constexpr std::string_view kTagHeader    = "--STRATA-TAG--";

// Permission bits given to directories the manifest builder creates implicitly
inline constexpr std::uint32_t kDefaultDirMode = 040775;

// ——— Defaults ———
inline constexpr std::string_view kDefaultRuntimeRoot = "/tmp/strata-runtime";
inline constexpr std::string_view kDefaultMountPoint  = "/strata";
inline constexpr std::size_t kDefaultMaxLayers        = 40;

// ——— Environment ———
inline constexpr std::string_view kEnvConfig       = "STRATA_CONFIG";
inline constexpr std::string_view kEnvStorageRoot  = "STRATA_STORAGE_ROOT";
inline constexpr std::string_view kEnvRuntimeRoot  = "STRATA_RUNTIME_ROOT";
inline constexpr std::string_view kEnvMountPoint   = "STRATA_MOUNT_POINT";
inline constexpr std::string_view kEnvLogLevel     = "STRATA_LOG_LEVEL";
inline constexpr std::string_view kEnvRuntime      = "STRATA_RUNTIME";

} // namespace strata::consts
