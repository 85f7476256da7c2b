#ifndef WRTPOLL_PARSERS_HPP
#define WRTPOLL_PARSERS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Named capture groups of one matched line. Groups that did not take part in
// the match are present with no value.
using Record = std::map<std::string, std::optional<std::string>>;

struct Pattern {
    std::regex regex;
    std::vector<std::pair<std::string, size_t>> groups;
};

// Searches every line for the pattern. Lines without a match are skipped.
std::vector<Record> parse_lines(const std::vector<std::string>& lines, const Pattern& pattern);

// Upper case hex pairs separated by colons.
std::string canonical_mac(std::string_view mac);

const Pattern& wireless_pattern();
const Pattern& lease_pattern();
const Pattern& neighbor_pattern();
const Pattern& arp_pattern();
const Pattern& counters_pattern();

// Every run of four or more digits in the output, in order of appearance.
std::vector<uint64_t> extract_counters(const std::vector<std::string>& lines);

#endif
