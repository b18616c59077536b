#include "UrlUtil.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

namespace FetchCache {
namespace UrlUtil {

static inline std::string CleanUrl(std::string s) {
    auto rtrim_any = [](std::string& x, const std::string& chars) {
        while (!x.empty() && chars.find(x.back()) != std::string::npos) x.pop_back();
    };

    // 1) Strip common trailing punctuation
    rtrim_any(s, ")],.!?;:");

    // 2) Fix parenthesis balance: drop extra trailing ')'
    auto count_char = [](const std::string& x, char c){ return static_cast<int>(std::count(x.begin(), x.end(), c)); };
    while (!s.empty() && count_char(s, ')') > count_char(s, '(') && s.back() == ')') {
        s.pop_back();
    }

    return s;
}

std::vector<std::string> ExtractUrls(const std::string& text) {
    static const std::regex url_regex(R"((https?://[^\s<>"']+))", std::regex::icase);
    std::vector<std::string> urls;
    for (auto i = std::sregex_iterator(text.begin(), text.end(), url_regex); i != std::sregex_iterator(); ++i) {
        auto u = CleanUrl(i->str());
        if (!u.empty()) urls.push_back(std::move(u));
    }
    return urls;
}

std::string NormalizeUrl(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return url;

    auto host_start = scheme_end + 3;
    auto host_end = url.find_first_of("/?#", host_start);
    if (host_end == std::string::npos) host_end = url.size();

    std::string head = url.substr(0, host_end);
    std::transform(head.begin(), head.end(), head.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    std::string rest = url.substr(host_end);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos) rest.erase(fragment);
    if (rest.empty() || rest[0] != '/') rest.insert(0, "/");

    return head + rest;
}

}
}
