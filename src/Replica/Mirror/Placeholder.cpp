//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cerrno>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <Replica/Base/UniqueFd.h>
#include <Replica/Mirror/Placeholder.h>

namespace {

constexpr std::string_view kLetters
  = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

auto Generator() -> std::mt19937&
{
  // Seeded per thread and per process: a forked worker must not repeat the
  // host's sequence.
  thread_local std::mt19937 engine = [] {
    std::random_device device;
    std::seed_seq seed { device(), device(),
      static_cast<unsigned>(::getpid()) };
    return std::mt19937(seed);
  }();
  return engine;
}

auto LastError() -> std::error_code
{
  return { errno, std::generic_category() };
}

} // namespace

auto replica::mirror::WritePlaceholder(
  const std::filesystem::path& path, const std::size_t size) -> Result<void>
{
  const UniqueFd fd(
    ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644));
  if (!fd) {
    return LastError();
  }

  std::string content(size, '\0');
  std::uniform_int_distribution<std::size_t> pick(0, kLetters.size() - 1);
  auto& engine = Generator();
  for (auto& c : content) {
    c = kLetters[pick(engine)];
  }

  std::size_t written = 0;
  while (written < content.size()) {
    const auto rc
      = ::write(fd.Get(), content.data() + written, content.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return LastError();
    }
    written += static_cast<std::size_t>(rc);
  }
  return {};
}
