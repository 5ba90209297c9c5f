#include "lint/FileFinder.hpp"

#include "doc/Parser.hpp"
#include "doc/TextUtil.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace lint {

static bool match_from(const char* p, const char* s) {
    while (*p) {
        if (p[0] == '*' && p[1] == '*') {
            p += 2;
            if (*p == '/' && match_from(p + 1, s)) return true;
            for (const char* t = s;; ++t) {
                if (match_from(p, t)) return true;
                if (!*t) return false;
            }
        }
        if (*p == '*') {
            ++p;
            for (const char* t = s;; ++t) {
                if (match_from(p, t)) return true;
                if (!*t || *t == '/') return false;
            }
        }
        if (!*s) return false;
        if (*p == '?') {
            if (*s == '/') return false;
        } else if (*p != *s) {
            return false;
        }
        ++p;
        ++s;
    }
    return *s == '\0';
}

static bool has_wildcard(const std::string& s) {
    return s.find_first_of("*?") != std::string::npos;
}

static std::string normalize(const fs::path& p) {
    std::string s = p.lexically_normal().generic_string();
    if (textutil::starts_with(s, "./")) s = s.substr(2);
    return s;
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(pattern.c_str(), path.c_str());
}

bool is_excluded(const fs::path& path, const std::vector<std::string>& exclude_patterns) {
    const std::string s = normalize(path);

    for (const auto& pat : exclude_patterns) {
        if (glob_match(pat, s)) return true;
        for (size_t pos = s.find('/'); pos != std::string::npos; pos = s.find('/', pos + 1)) {
            if (glob_match(pat, s.substr(pos + 1))) return true;
        }
    }
    return false;
}

static void walk(const fs::path& root, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return;

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec)) out.push_back(it->path());
    }
}

// Longest leading run of wildcard-free components, e.g. "docs/**/*.adoc" -> "docs".
static fs::path glob_root(const std::string& pattern) {
    fs::path root;
    for (const auto& part : fs::path(pattern)) {
        if (has_wildcard(part.string())) break;
        root /= part;
    }
    return root.empty() ? fs::path(".") : root;
}

std::vector<fs::path> find_markup_files(const std::vector<std::string>& patterns,
                                        const std::vector<std::string>& exclude_patterns) {
    std::vector<fs::path> candidates;

    for (const auto& pattern : patterns) {
        if (has_wildcard(pattern)) {
            std::vector<fs::path> walked;
            walk(glob_root(pattern), walked);

            const std::string pat = normalize(fs::path(pattern));
            for (auto& p : walked) {
                if (glob_match(pat, normalize(p))) candidates.push_back(std::move(p));
            }
            continue;
        }

        std::error_code ec;
        const fs::path p(pattern);
        if (fs::is_directory(p, ec)) {
            walk(p, candidates);
        } else if (fs::is_regular_file(p, ec)) {
            candidates.push_back(p);
        }
    }

    std::vector<fs::path> files;
    for (auto& p : candidates) {
        if (!doc::is_markup_file(p)) continue;
        if (is_excluded(p, exclude_patterns)) continue;
        files.push_back(p.lexically_normal());
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    return files;
}

}  // namespace lint
