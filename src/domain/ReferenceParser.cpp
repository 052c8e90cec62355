#include "domain/ReferenceParser.hpp"
#include "domain/ImportErrors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace hubingest::domain {

namespace {
    const char* kHostPrefixes[] = {
        "https://huggingface.co/",
        "https://www.huggingface.co/",
        "http://huggingface.co/",
        "http://www.huggingface.co/",
    };

    const char* kShapeHelp = "Expected: org/repo/path/to/file.parquet";

    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
        return s;
    }

    void Trim(std::string& s) {
        const char* ws = " \t\r\n";
        s.erase(0, s.find_first_not_of(ws));
        auto last = s.find_last_not_of(ws);
        if (last == std::string::npos) s.clear();
        else s.erase(last + 1);
    }

    bool EndsWithIgnoreCase(const std::string& text, const std::string& suffix) {
        if (text.size() < suffix.size()) return false;
        return ToLower(text.substr(text.size() - suffix.size())) == ToLower(suffix);
    }

    // Returns true when a known host prefix was removed.
    bool StripHostPrefix(std::string& s) {
        std::string lower = ToLower(s);
        for (const char* prefix : kHostPrefixes) {
            std::string p(prefix);
            if (lower.compare(0, p.size(), p) == 0) {
                s.erase(0, p.size());
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> SplitSegments(const std::string& s) {
        std::vector<std::string> parts;
        std::stringstream ss(s);
        std::string item;
        while (std::getline(ss, item, '/')) {
            if (!item.empty()) parts.push_back(item);
        }
        return parts;
    }

    std::string JoinFrom(const std::vector<std::string>& parts, size_t start) {
        std::string out;
        for (size_t i = start; i < parts.size(); ++i) {
            if (!out.empty()) out += "/";
            out += parts[i];
        }
        return out;
    }

    void RequireArchiveSuffix(const std::string& filePath) {
        if (!EndsWithIgnoreCase(filePath, ReferenceParser::kArchiveSuffix)) {
            throw InvalidReference("The Hugging Face file path must point to a .parquet file (got '" + filePath + "')");
        }
    }
}

RemoteReference ReferenceParser::Parse(const std::string& raw) {
    std::string input = raw;
    Trim(input);

    if (StripHostPrefix(input)) {
        // Pasted browser URLs often carry ?download=true or an anchor.
        auto cut = input.find_first_of("?#");
        if (cut != std::string::npos) input.erase(cut);
    }

    std::vector<std::string> parts = SplitSegments(input);
    if (parts.size() < 3) {
        throw InvalidReference(std::string("Invalid Hugging Face parquet path. ") + kShapeHelp);
    }

    RepoKind kind = RepoKind::Auto;
    size_t i = 0;
    if (parts[0] == "datasets") {
        kind = RepoKind::Datasets;
        i = 1;
    }

    // [datasets/]org/repo/(resolve|blob)/REVISION/<filePath>
    if (parts.size() > i + 2 && (parts[i + 2] == "resolve" || parts[i + 2] == "blob")) {
        if (parts.size() < i + 5) {
            throw InvalidReference("Invalid Hugging Face parquet URL. Expected: .../(resolve|blob)/REVISION/path/to/file.parquet");
        }
        std::string filePath = JoinFrom(parts, i + 4);
        RequireArchiveSuffix(filePath);

        // The bare URL shape belongs to model repos unless "datasets/" pinned it.
        RepoKind finalKind = (kind == RepoKind::Auto) ? RepoKind::Models : kind;
        return RemoteReference(parts[i] + "/" + parts[i + 1], parts[i + 3], filePath, finalKind);
    }

    // [datasets/]org/repo[@rev]/<filePath>
    if (parts.size() < i + 3) {
        throw InvalidReference(std::string("Invalid Hugging Face parquet path. ") + kShapeHelp);
    }

    const std::string& org = parts[i];
    std::string repo = parts[i + 1];
    std::string revision = "main";

    auto at = repo.find('@');
    if (at != std::string::npos) {
        std::string name = repo.substr(0, at);
        std::string rev = repo.substr(at + 1);
        if (name.empty() || rev.empty() || rev.find('@') != std::string::npos) {
            throw InvalidReference("Malformed revision in '" + repo + "'. Expected: org/repo@revision/path/to/file.parquet");
        }
        repo = name;
        revision = rev;
    }

    std::string filePath = JoinFrom(parts, i + 2);
    RequireArchiveSuffix(filePath);

    return RemoteReference(org + "/" + repo, revision, filePath, kind);
}

} // namespace hubingest::domain
