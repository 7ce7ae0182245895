#ifndef BLUESWITCH_UTILS_HPP
#define BLUESWITCH_UTILS_HPP

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

inline std::string to_lower(std::string_view s) {
    std::string ret(s);
    std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ret;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string_view trim(std::string_view s) noexcept {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

// Empty fields are kept, so "a,,b" yields three entries.
inline std::vector<std::string_view> split(std::string_view s, char c) {
    std::vector<std::string_view> ret;
    size_t start = 0;
    while (true) {
        auto pos = s.find(c, start);
        if (pos == std::string_view::npos) {
            ret.push_back(s.substr(start));
            return ret;
        }
        ret.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

#endif
