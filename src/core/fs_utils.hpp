#ifndef GUIDEKIT_CORE_FS_UTILS_HPP_
#define GUIDEKIT_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace guidekit::core {

namespace detail {

inline std::filesystem::path BuildTempSiblingPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

inline bool WriteTempFile(const std::filesystem::path& temp_path, std::string_view text,
                          std::string& error) {
  std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open temp file '" + temp_path.string() + "'";
    return false;
  }

  out_file << text;
  out_file.flush();
  if (!out_file) {
    error = "failed while writing temp file '" + temp_path.string() + "'";
    return false;
  }
  return true;
}

// Exclusive create through `fopen(..., "wx")`, for file systems without hard
// links. A failed write removes the partial file.
inline bool WriteExclusiveFile(const std::filesystem::path& output_path, std::string_view text,
                               bool& already_exists, std::string& error) {
  already_exists = false;
  std::FILE* file = std::fopen(output_path.string().c_str(), "wx");
  if (file == nullptr) {
    if (errno == EEXIST) {
      already_exists = true;
      error = output_path.string() + " already exists";
    } else {
      error = "failed to create file '" + output_path.string() + "': " + std::strerror(errno);
    }
    return false;
  }

  const bool written = std::fwrite(text.data(), 1U, text.size(), file) == text.size();
  const bool closed = std::fclose(file) == 0;
  if (!written || !closed) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(output_path, cleanup_ec);
    error = "failed while writing file '" + output_path.string() + "'";
    return false;
  }
  return true;
}

inline bool IsHardLinkUnsupported(const std::error_code& ec) {
  return ec == std::errc::operation_not_supported || ec == std::errc::operation_not_permitted;
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& file_path, std::string& text,
                         std::string& error) {
  text.clear();
  error.clear();

  std::ifstream input(file_path, std::ios::binary);
  if (!input) {
    error = "failed to open file '" + file_path.string() + "'";
    return false;
  }

  text.assign((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file '" + file_path.string() + "'";
    return false;
  }
  return true;
}

// Publishes `text` at `output_path` only if nothing exists there yet.
//
// The content is written to a temporary sibling first and then hard-linked
// into place. `create_hard_link` fails with `file_exists` instead of
// replacing, so a concurrent writer can never be clobbered and a failed write
// never leaves a truncated file behind. `already_exists` distinguishes that
// refusal from I/O errors. File systems without hard links (FAT, exFAT, some
// SMB mounts) fall back to an exclusive create.
inline bool WriteNewTextFile(const std::filesystem::path& output_path, std::string_view text,
                             bool& already_exists, std::string& error) {
  already_exists = false;
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildTempSiblingPath(output_path);
  if (!detail::WriteTempFile(temp_path, text, error)) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    return false;
  }

  std::error_code link_ec;
  std::filesystem::create_hard_link(temp_path, output_path, link_ec);

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);

  if (link_ec && detail::IsHardLinkUnsupported(link_ec)) {
    return detail::WriteExclusiveFile(output_path, text, already_exists, error);
  }
  if (link_ec) {
    if (link_ec == std::errc::file_exists) {
      already_exists = true;
      error = output_path.string() + " already exists";
    } else {
      error = "failed to publish file '" + output_path.string() + "': " + link_ec.message();
    }
    return false;
  }
  return true;
}

// Replaces `output_path` through a temp file + rename so readers never see a
// partially written file. Used for the hook script, which may be rewritten.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildTempSiblingPath(output_path);
  if (!detail::WriteTempFile(temp_path, text, error)) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    return false;
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace guidekit::core

#endif // GUIDEKIT_CORE_FS_UTILS_HPP_
