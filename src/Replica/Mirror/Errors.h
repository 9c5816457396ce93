//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace replica::mirror {

//! Outcomes of a mirror run other than success.
enum class MirrorError : int {
  kPathError = 1,
  kCountMismatch,
  kStructuralMismatch,
  kWorkerWriteError,
  kInterrupted,
};

//! Category for mirror errors.
class MirrorErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "Replica Mirror Error";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override
  {
    switch (static_cast<MirrorError>(ev)) {
    case MirrorError::kPathError:
      return "source is not a directory or destination already exists";
    case MirrorError::kCountMismatch:
      return "number of results differs from number of tasks";
    case MirrorError::kStructuralMismatch:
      return "destination tree does not match the source tree";
    case MirrorError::kWorkerWriteError:
      return "a worker could not write a placeholder file";
    case MirrorError::kInterrupted:
      return "the run was interrupted";
    default:
      return "unknown mirror error";
    }
  }
};

[[nodiscard]] auto GetMirrorErrorCategory() noexcept
  -> const MirrorErrorCategory&;

inline auto make_error_code(MirrorError e) noexcept -> std::error_code
{
  return { static_cast<int>(e), GetMirrorErrorCategory() };
}

//! Process exit code reported by the command line tool for `error`.
[[nodiscard]] auto ExitCodeFor(MirrorError error) noexcept -> int;

//! Rank used to pick the error that decides the exit code when a run has
//! several; higher is more severe.
[[nodiscard]] auto Severity(MirrorError error) noexcept -> int;

//! The source or destination path is unusable. Raised before any unit,
//! channel or directory is created.
class PathError : public std::system_error {
public:
  PathError(std::filesystem::path path, const std::string& what)
    : std::system_error(make_error_code(MirrorError::kPathError), what)
    , path_(std::move(path))
  {
  }

  [[nodiscard]] auto Path() const noexcept -> const std::filesystem::path&
  {
    return path_;
  }

private:
  std::filesystem::path path_;
};

//! The run was cancelled. Raised after the pipeline was torn down.
class Interrupted : public std::system_error {
public:
  explicit Interrupted(const std::string& what)
    : std::system_error(make_error_code(MirrorError::kInterrupted), what)
  {
  }
};

} // namespace replica::mirror

template <>
struct std::is_error_code_enum<replica::mirror::MirrorError> : true_type { };
