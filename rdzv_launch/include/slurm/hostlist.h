#pragma once

#include <string>
#include <vector>

namespace rdzv_launch::slurm {

/**
 * @brief Expand a compressed Slurm hostlist into individual hostnames.
 *
 * Follows `scontrol show hostnames`: items are comma separated, a bracket
 * group expands numeric ranges keeping zero padding, and several groups in one
 * item expand as a cartesian product (leftmost group outermost).
 *
 *   "nid[008-010],login1"  ->  {"nid008", "nid009", "nid010", "login1"}
 *   "r[1-2]n[1-2]"         ->  {"r1n1", "r1n2", "r2n1", "r2n2"}
 *
 * Order is preserved as written; duplicates are kept and empty items are
 * skipped.
 *
 * @throws ConfigurationError(kMalformedHostList) on unbalanced or nested
 *         brackets and invalid ranges.
 */
std::vector<std::string> ExpandHostList(const std::string &hostlist);

} // namespace rdzv_launch::slurm
