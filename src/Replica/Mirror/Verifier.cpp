//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <Replica/Mirror/TreeWalker.h>
#include <Replica/Mirror/Verifier.h>

using replica::mirror::VerificationReport;

namespace {

auto At(const std::vector<std::string>& list, const std::size_t index)
  -> std::string
{
  return index < list.size() ? list[index] : std::string {};
}

} // namespace

auto replica::mirror::CompareListings(std::vector<std::string> source,
  std::vector<std::string> destination, std::vector<std::string> results,
  const std::size_t window) -> VerificationReport
{
  std::sort(source.begin(), source.end());
  std::sort(destination.begin(), destination.end());
  std::sort(results.begin(), results.end());

  VerificationReport report;
  report.source_count = source.size();
  report.destination_count = destination.size();
  report.result_count = results.size();
  report.matched = source == destination && destination == results;
  if (report.matched) {
    return report;
  }

  const auto longest
    = std::max({ source.size(), destination.size(), results.size() });
  std::size_t first = 0;
  while (first < longest
    && At(source, first) == At(destination, first)
    && At(destination, first) == At(results, first)
    && first < source.size() && first < destination.size()
    && first < results.size()) {
    ++first;
  }
  report.first_divergence = first;
  for (auto i = first; i < longest && i - first < window; ++i) {
    report.rows.push_back({ .index = i,
      .source = At(source, i),
      .destination = At(destination, i),
      .result = At(results, i) });
  }
  return report;
}

auto replica::mirror::VerifyTrees(const std::filesystem::path& source_root,
  const std::filesystem::path& destination_root,
  const std::vector<std::string>& results, const std::size_t window)
  -> VerificationReport
{
  return CompareListings(
    ListFiles(source_root), ListFiles(destination_root), results, window);
}
