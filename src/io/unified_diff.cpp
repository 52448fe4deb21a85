#include "unflake/io/unified_diff.hpp"
#include <algorithm>
#include <utility>

namespace unflake {

namespace {

using Lines = std::vector<std::string>;

struct MatchingBlock {
    size_t a{};
    size_t b{};
    size_t size{};
};

// Edit steps the search may take before it gives up on the middle section.
// The backtrace keeps one snapshot per step, so memory grows with the square
// of this bound.
constexpr long max_edit_distance = 1000;

enum class OpTag { EQUAL, REPLACE, DELETE, INSERT };

struct Opcode {
    OpTag tag{};
    size_t i1{};
    size_t i2{};
    size_t j1{};
    size_t j2{};
};

// Myers' greedy shortest edit script over a[a_begin, a_begin + n) and
// b[b_begin, b_begin + m); returns matched index pairs in order
auto middle_matches(const Lines& a, size_t a_begin, long n, const Lines& b, size_t b_begin, long m)
    -> std::vector<std::pair<size_t, size_t>> {
    std::vector<std::pair<size_t, size_t>> matches;
    long max = n + m;
    if (max == 0) {
        return matches;
    }

    long offset = max + 1;
    std::vector<long> v(static_cast<size_t>(2 * max + 3), 0);
    std::vector<std::vector<long>> trace;  // trace[d] holds v[-d-1 .. d+1] before step d

    auto equal = [&](long x, long y) {
        return a[a_begin + static_cast<size_t>(x)] == b[b_begin + static_cast<size_t>(y)];
    };

    bool done = false;
    for (long d = 0; d <= max && !done; ++d) {
        // Past the bound the whole middle is reported as one replacement
        if (d > max_edit_distance) {
            return {};
        }
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));
        for (long k = -d; k <= d; k += 2) {
            long x = (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1]))
                         ? v[offset + k + 1]
                         : v[offset + k - 1] + 1;
            long y = x - k;
            while (x < n && y < m && equal(x, y)) {
                ++x;
                ++y;
            }
            v[offset + k] = x;
            if (x >= n && y >= m) {
                done = true;
                break;
            }
        }
    }

    long x = n;
    long y = m;
    for (long d = static_cast<long>(trace.size()) - 1; d >= 0; --d) {
        const auto& snapshot = trace[static_cast<size_t>(d)];
        auto at = [&](long k) { return snapshot[static_cast<size_t>(k + d + 1)]; };

        long k = x - y;
        long prev_k = (k == -d || (k != d && at(k - 1) < at(k + 1))) ? k + 1 : k - 1;
        long prev_x = at(prev_k);
        long prev_y = prev_x - prev_k;

        while (x > prev_x && y > prev_y) {
            --x;
            --y;
            matches.emplace_back(a_begin + static_cast<size_t>(x), b_begin + static_cast<size_t>(y));
        }
        x = prev_x;
        y = prev_y;
    }

    std::reverse(matches.begin(), matches.end());
    return matches;
}

auto matching_blocks(const Lines& a, const Lines& b) -> std::vector<MatchingBlock> {
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix
           && a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < prefix; ++i) {
        pairs.emplace_back(i, i);
    }
    auto middle = middle_matches(a, prefix, static_cast<long>(a.size() - prefix - suffix), b, prefix,
                                 static_cast<long>(b.size() - prefix - suffix));
    pairs.insert(pairs.end(), middle.begin(), middle.end());
    for (size_t i = 0; i < suffix; ++i) {
        pairs.emplace_back(a.size() - suffix + i, b.size() - suffix + i);
    }

    std::vector<MatchingBlock> blocks;
    for (const auto& [i, j] : pairs) {
        if (!blocks.empty() && blocks.back().a + blocks.back().size == i
            && blocks.back().b + blocks.back().size == j) {
            ++blocks.back().size;
        } else {
            blocks.push_back(MatchingBlock{.a = i, .b = j, .size = 1});
        }
    }
    blocks.push_back(MatchingBlock{.a = a.size(), .b = b.size(), .size = 0});
    return blocks;
}

auto opcodes(const Lines& a, const Lines& b) -> std::vector<Opcode> {
    std::vector<Opcode> codes;
    size_t i = 0;
    size_t j = 0;

    for (const auto& block : matching_blocks(a, b)) {
        if (i < block.a && j < block.b) {
            codes.push_back({OpTag::REPLACE, i, block.a, j, block.b});
        } else if (i < block.a) {
            codes.push_back({OpTag::DELETE, i, block.a, j, block.b});
        } else if (j < block.b) {
            codes.push_back({OpTag::INSERT, i, block.a, j, block.b});
        }
        i = block.a + block.size;
        j = block.b + block.size;
        if (block.size > 0) {
            codes.push_back({OpTag::EQUAL, block.a, i, block.b, j});
        }
    }
    return codes;
}

// Hunks with up to `context` unchanged lines around each change
auto grouped_opcodes(const Lines& a, const Lines& b, size_t context)
    -> std::vector<std::vector<Opcode>> {
    auto codes = opcodes(a, b);
    if (codes.empty()) {
        codes.push_back({OpTag::EQUAL, 0, 1, 0, 1});
    }

    if (codes.front().tag == OpTag::EQUAL) {
        auto& first = codes.front();
        first.i1 = std::max(first.i1, first.i2 > context ? first.i2 - context : 0);
        first.j1 = std::max(first.j1, first.j2 > context ? first.j2 - context : 0);
    }
    if (codes.back().tag == OpTag::EQUAL) {
        auto& last = codes.back();
        last.i2 = std::min(last.i2, last.i1 + context);
        last.j2 = std::min(last.j2, last.j1 + context);
    }

    std::vector<std::vector<Opcode>> groups;
    std::vector<Opcode> group;
    for (auto code : codes) {
        if (code.tag == OpTag::EQUAL && code.i2 - code.i1 > 2 * context) {
            group.push_back({OpTag::EQUAL, code.i1, std::min(code.i2, code.i1 + context), code.j1,
                             std::min(code.j2, code.j1 + context)});
            groups.push_back(std::move(group));
            group.clear();
            code.i1 = std::max(code.i1, code.i2 - context);
            code.j1 = std::max(code.j1, code.j2 - context);
        }
        group.push_back(code);
    }
    if (!group.empty() && !(group.size() == 1 && group.front().tag == OpTag::EQUAL)) {
        groups.push_back(std::move(group));
    }
    return groups;
}

auto format_range(size_t start, size_t stop) -> std::string {
    auto beginning = start + 1;
    auto length = stop - start;
    if (length == 1) {
        return std::to_string(beginning);
    }
    if (length == 0) {
        --beginning;  // Empty ranges begin at the line before
    }
    return std::to_string(beginning) + "," + std::to_string(length);
}

auto append_line(std::string& text, char marker, const std::string& line) -> void {
    text += marker;
    text += line;
    if (!line.ends_with('\n')) {
        text += "\n\\ No newline at end of file\n";
    }
}

} // namespace

auto unified_diff(const std::vector<std::string>& old_lines,
                  const std::vector<std::string>& new_lines, const std::string& filename,
                  size_t context) -> std::string {
    auto groups = grouped_opcodes(old_lines, new_lines, context);
    if (groups.empty()) {
        return "";
    }

    std::string text = "--- original/" + filename + "\n+++ fixed/" + filename + "\n";
    for (const auto& group : groups) {
        text += "@@ -" + format_range(group.front().i1, group.back().i2) + " +"
                + format_range(group.front().j1, group.back().j2) + " @@\n";

        for (const auto& code : group) {
            if (code.tag == OpTag::EQUAL) {
                for (size_t i = code.i1; i < code.i2; ++i) {
                    append_line(text, ' ', old_lines[i]);
                }
                continue;
            }
            if (code.tag == OpTag::REPLACE || code.tag == OpTag::DELETE) {
                for (size_t i = code.i1; i < code.i2; ++i) {
                    append_line(text, '-', old_lines[i]);
                }
            }
            if (code.tag == OpTag::REPLACE || code.tag == OpTag::INSERT) {
                for (size_t j = code.j1; j < code.j2; ++j) {
                    append_line(text, '+', new_lines[j]);
                }
            }
        }
    }
    return text;
}

} // namespace unflake
