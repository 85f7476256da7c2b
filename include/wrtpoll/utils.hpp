#ifndef WRTPOLL_UTILS_HPP
#define WRTPOLL_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

template <typename F>
class Finally {
  private:
    F fin_;

  public:
    explicit Finally(F&& fin) : fin_(std::forward<F>(fin)) {}

    ~Finally() {
        fin_();
    }

    Finally(const Finally&) = delete;
    Finally(Finally&&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally& operator=(Finally&&) = delete;
};

template <typename F>
Finally<F> finally(F&& fin) {
    return Finally<F>(std::forward<F>(fin));
}

inline std::string_view trim_back(std::string_view s) noexcept {
    size_t pos = s.size();
    while (pos > 0 && std::isspace(static_cast<unsigned char>(s[pos-1]))) {
        --pos;
    }
    return s.substr(0, pos);
}

inline std::string_view trim(std::string_view s) noexcept {
    size_t pos = 0;
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return trim_back(s.substr(pos));
}

inline bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

inline std::string to_upper(std::string_view s) {
    std::string ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return ret;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
        return std::toupper(x) == std::toupper(y);
    });
}

// Splits command output on '\n'. Carriage returns are dropped from line ends
// and a trailing newline does not produce an empty final line.
inline std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> ret;
    while (!text.empty()) {
        auto pos = text.find('\n');
        auto line = text.substr(0, pos);
        while (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        ret.emplace_back(line);
        if (pos == std::string_view::npos) {
            break;
        }
        text.remove_prefix(pos + 1);
    }
    return ret;
}

#endif
