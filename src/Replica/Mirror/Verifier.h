//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace replica::mirror {

//! Index-aligned entries of the three sorted listings. A listing shorter
//! than the index shows an empty string.
struct DivergenceRow {
  std::size_t index { 0 };
  std::string source;
  std::string destination;
  std::string result;
};

struct VerificationReport {
  bool matched { false };
  std::size_t source_count { 0 };
  std::size_t destination_count { 0 };
  std::size_t result_count { 0 };
  //! First index at which the sorted listings differ.
  std::optional<std::size_t> first_divergence;
  //! Rows from the first divergence on, bounded by the window size.
  std::vector<DivergenceRow> rows;
};

/*!
  Sorts the three listings and checks that they are pairwise equal.

  On mismatch the report carries up to `window` index-aligned rows starting
  at the first index where the listings differ. Never throws on mismatch.
*/
[[nodiscard]] auto CompareListings(std::vector<std::string> source,
  std::vector<std::string> destination, std::vector<std::string> results,
  std::size_t window) -> VerificationReport;

//! Enumerates both trees afresh and compares them with `results`.
[[nodiscard]] auto VerifyTrees(const std::filesystem::path& source_root,
  const std::filesystem::path& destination_root,
  const std::vector<std::string>& results, std::size_t window)
  -> VerificationReport;

} // namespace replica::mirror
