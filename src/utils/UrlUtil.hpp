#pragma once
#include <string>
#include <vector>

namespace FetchCache {
namespace UrlUtil {

// Extract absolute http(s) URLs from text and sanitize trailing punctuation
std::vector<std::string> ExtractUrls(const std::string& text);

// Canonical cache key for a URL:
// - scheme and host are lowercased,
// - the fragment is dropped,
// - an empty path becomes "/".
// Strings without "://" are returned unchanged.
std::string NormalizeUrl(const std::string& url);

}
}
