#include <wrtpoll/parsers.hpp>
#include <wrtpoll/utils.hpp>

#include <spdlog/spdlog.h>

#include <charconv>

std::vector<Record> parse_lines(const std::vector<std::string>& lines, const Pattern& pattern) {
    std::vector<Record> results;
    for (const auto& line : lines) {
        std::smatch match;
        if (!std::regex_search(line, match, pattern.regex)) {
            spdlog::debug("could not parse row: {}", line);
            continue;
        }
        Record record;
        for (const auto& [name, index] : pattern.groups) {
            if (index < match.size() && match[index].matched) {
                record[name] = match[index].str();
            } else {
                record[name] = std::nullopt;
            }
        }
        results.push_back(std::move(record));
    }
    return results;
}

std::string canonical_mac(std::string_view mac) {
    auto ret = to_upper(mac);
    for (auto& c : ret) {
        if (c == '-') {
            c = ':';
        }
    }
    return ret;
}

const Pattern& wireless_pattern() {
    static const Pattern pattern{
        std::regex{R"(\w+\s)"
                   R"((([0-9A-F]{2}[:-]){5}([0-9A-F]{2})))"},
        {{"mac", 1}}
    };
    return pattern;
}

const Pattern& lease_pattern() {
    static const Pattern pattern{
        std::regex{R"(\w+\s)"
                   R"((([0-9a-f]{2}[:-]){5}([0-9a-f]{2}))\s)"
                   R"((([0-9]{1,3}[\.]){3}[0-9]{1,3})\s)"
                   R"((([^\s]+)))"},
        {{"mac", 1}, {"ip", 4}, {"host", 6}}
    };
    return pattern;
}

const Pattern& neighbor_pattern() {
    static const Pattern pattern{
        std::regex{R"((([0-9]{1,3}[\.]){3}[0-9]{1,3}|)"
                   R"(([0-9a-fA-F]{1,4}:){1,7}[0-9a-fA-F]{0,4}(:[0-9a-fA-F]{1,4}){1,7})\s)"
                   R"(\w+\s)"
                   R"(\w+\s)"
                   R"((\w+\s(([0-9a-f]{2}[:-]){5}([0-9a-f]{2})))?\s)"
                   R"(\s?(router)?)"
                   R"(\s?(nud)?)"
                   R"((\w+))"},
        {{"ip", 1}, {"mac", 6}, {"status", 11}}
    };
    return pattern;
}

const Pattern& arp_pattern() {
    static const Pattern pattern{
        std::regex{R"(.+\s)"
                   R"(\((([0-9]{1,3}[\.]){3}[0-9]{1,3})\)\s)"
                   R"(.+\s)"
                   R"((([0-9a-f]{2}[:-]){5}([0-9a-f]{2})))"
                   R"(\s)"
                   R"(.*)"},
        {{"ip", 1}, {"mac", 3}}
    };
    return pattern;
}

const Pattern& counters_pattern() {
    static const Pattern pattern{
        std::regex{R"([\d]{4,})"},
        {{"data", 0}}
    };
    return pattern;
}

std::vector<uint64_t> extract_counters(const std::vector<std::string>& lines) {
    std::vector<uint64_t> ret;
    const auto& regex = counters_pattern().regex;
    for (const auto& line : lines) {
        for (auto it = std::sregex_iterator(line.begin(), line.end(), regex); it != std::sregex_iterator(); ++it) {
            auto token = it->str();
            uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec != std::errc{}) {
                spdlog::debug("counter {} is out of range", token);
                continue;
            }
            ret.push_back(value);
        }
    }
    return ret;
}
