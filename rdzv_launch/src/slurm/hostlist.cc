#include "rdzv_launch/include/slurm/hostlist.h"

#include <charconv>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

#include "rdzv_launch/include/errors.h"

namespace rdzv_launch::slurm {

namespace {

// Upper bound on the number of hosts a single hostlist may expand to.
constexpr size_t kMaxExpandedHosts = 1 << 20;

[[noreturn]] void ThrowMalformed(const std::string &hostlist, const std::string &reason) {
    throw ConfigurationError(ErrorCode::kMalformedHostList, std::format("\"{}\": {}", hostlist, reason));
}

// Split on commas that are not inside a bracket group.
std::vector<std::string> SplitTopLevel(const std::string &hostlist) {
    std::vector<std::string> items;
    std::string current;
    int depth = 0;
    for (char c : hostlist) {
        if (c == '[') {
            if (depth > 0) {
                ThrowMalformed(hostlist, "nested '['");
            }
            ++depth;
        } else if (c == ']') {
            if (depth == 0) {
                ThrowMalformed(hostlist, "unmatched ']'");
            }
            --depth;
        } else if (c == ',' && depth == 0) {
            items.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (depth != 0) {
        ThrowMalformed(hostlist, "unmatched '['");
    }
    items.push_back(std::move(current));
    return items;
}

uint64_t ParseBound(const std::string &hostlist, const std::string &digits) {
    if (digits.empty() || digits.size() > 18) {
        ThrowMalformed(hostlist, std::format("invalid range bound \"{}\"", digits));
    }
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        ThrowMalformed(hostlist, std::format("invalid range bound \"{}\"", digits));
    }
    return value;
}

// "1-3,07" -> {"1", "2", "3", "07"}; padding follows the width of the lower bound.
std::vector<std::string> ExpandRangeSet(const std::string &hostlist, const std::string &body) {
    std::vector<std::string> values;
    size_t start = 0;
    while (start <= body.size()) {
        size_t end = body.find(',', start);
        if (end == std::string::npos) {
            end = body.size();
        }
        const std::string part = body.substr(start, end - start);
        const size_t dash = part.find('-');
        const std::string lo_str = dash == std::string::npos ? part : part.substr(0, dash);
        const std::string hi_str = dash == std::string::npos ? part : part.substr(dash + 1);
        const uint64_t lo = ParseBound(hostlist, lo_str);
        const uint64_t hi = ParseBound(hostlist, hi_str);
        if (hi < lo) {
            ThrowMalformed(hostlist, std::format("descending range \"{}\"", part));
        }
        if (hi - lo >= kMaxExpandedHosts || values.size() + (hi - lo) >= kMaxExpandedHosts) {
            ThrowMalformed(hostlist, "expands to too many hosts");
        }
        const size_t width = lo_str.size();
        for (uint64_t v = lo; v <= hi; ++v) { values.push_back(std::format("{:0{}}", v, width)); }
        start = end + 1;
    }
    return values;
}

std::vector<std::string> ExpandItem(const std::string &hostlist, const std::string &item) {
    const size_t lb = item.find('[');
    if (lb == std::string::npos) {
        return {item};
    }
    const size_t rb = item.find(']', lb);
    const std::string prefix = item.substr(0, lb);
    const auto ranges = ExpandRangeSet(hostlist, item.substr(lb + 1, rb - lb - 1));
    const auto suffixes = ExpandItem(hostlist, item.substr(rb + 1));

    if (ranges.size() * suffixes.size() > kMaxExpandedHosts) {
        ThrowMalformed(hostlist, "expands to too many hosts");
    }
    std::vector<std::string> hosts;
    hosts.reserve(ranges.size() * suffixes.size());
    for (const auto &r : ranges) {
        for (const auto &s : suffixes) { hosts.push_back(prefix + r + s); }
    }
    return hosts;
}

} // namespace

std::vector<std::string> ExpandHostList(const std::string &hostlist) {
    std::vector<std::string> hosts;
    for (const auto &item : SplitTopLevel(hostlist)) {
        // scontrol tolerates empty items such as a trailing comma
        if (item.empty()) {
            continue;
        }
        auto expanded = ExpandItem(hostlist, item);
        if (hosts.size() + expanded.size() > kMaxExpandedHosts) {
            ThrowMalformed(hostlist, "expands to too many hosts");
        }
        hosts.insert(hosts.end(), expanded.begin(), expanded.end());
    }
    return hosts;
}

} // namespace rdzv_launch::slurm
