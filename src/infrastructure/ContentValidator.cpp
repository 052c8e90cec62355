#include "infrastructure/ContentValidator.hpp"
#include "domain/ImportErrors.hpp"
#include <nlohmann/json.hpp>
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <sstream>

namespace hubingest::infrastructure {

namespace {
    constexpr const char* kMagic = "PAR1";
    constexpr size_t kMagicLen = 4;
    constexpr const char* kPointerSignature = "version https://git-lfs.github.com/spec/v1";
    constexpr size_t kPreviewBytes = 300;

    std::string Head(const ContentValidator::Bytes& buf, size_t n) {
        return std::string(buf.begin(), buf.begin() + std::min(n, buf.size()));
    }

    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
        return s;
    }

    bool Contains(const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    }
}

bool ContentValidator::IsArchive(const Bytes& buf) {
    if (buf.size() < 2 * kMagicLen) return false;
    return std::memcmp(buf.data(), kMagic, kMagicLen) == 0 &&
           std::memcmp(buf.data() + buf.size() - kMagicLen, kMagic, kMagicLen) == 0;
}

std::optional<ContentValidator::Bytes> ContentValidator::Gunzip(const Bytes& buf) {
    if (buf.empty()) return std::nullopt;

    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(buf.data());
    strm.avail_in = static_cast<uInt>(buf.size());

    // 16+MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        return std::nullopt;
    }

    Bytes out;
    const size_t CHUNK = 16384;
    std::vector<unsigned char> chunk(CHUNK);

    int ret;
    do {
        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            return std::nullopt;
        }

        size_t have = chunk.size() - strm.avail_out;
        out.insert(out.end(), chunk.begin(), chunk.begin() + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return out;
}

ContentValidator::Bytes ContentValidator::MaybeDecompress(const Bytes& buf,
                                                          const std::string& contentType,
                                                          const std::string& contentEncoding) {
    std::string enc = ToLower(contentEncoding);
    std::string ct = ToLower(contentType);
    bool declared = Contains(enc, "gzip") || Contains(ct, "gzip");
    bool magic = buf.size() >= 2 && buf[0] == 0x1f && buf[1] == 0x8b;
    if (!declared && !magic) {
        return buf;
    }

    if (auto inflated = Gunzip(buf)) {
        return *inflated;
    }
    std::cerr << "[ContentValidator] gunzip failed, keeping original bytes" << std::endl;
    return buf;
}

bool ContentValidator::LooksLikePointerRecord(const Bytes& buf) {
    return Head(buf, 200).rfind(kPointerSignature, 0) == 0;
}

bool ContentValidator::LooksLikeMarkup(const Bytes& buf) {
    std::string head = Head(buf, 300);
    head.erase(0, head.find_first_not_of(" \t\r\n"));
    head = ToLower(head);
    return head.rfind("<!doctype html", 0) == 0 || head.rfind("<html", 0) == 0 || Contains(head, "<head");
}

ContentValidator::Bytes ContentValidator::Validate(const domain::FetchResult& fetched) {
    Bytes buf = MaybeDecompress(fetched.bytes, fetched.contentType, fetched.contentEncoding);
    if (IsArchive(buf)) {
        return buf;
    }

    bool pointer = LooksLikePointerRecord(buf);
    bool markup = LooksLikeMarkup(buf);

    std::vector<std::string> hints;
    if (pointer) hints.push_back("The downloaded file looks like a Git-LFS pointer (not the actual parquet).");
    if (markup) hints.push_back("The downloaded file looks like HTML (likely a login/404 page).");
    if (Contains(ToLower(fetched.contentType), "text/html")) hints.push_back("content-type=" + fetched.contentType);

    // dump() with replace keeps the preview printable for arbitrary bytes.
    std::string preview = nlohmann::json(Head(buf, kPreviewBytes))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::stringstream ss;
    ss << "Invalid parquet file received from Hugging Face.\n"
       << "Requested: " << fetched.requestedUrl << "\n"
       << "Final URL: " << fetched.finalUrl << "\n"
       << "content-type: " << (fetched.contentType.empty() ? "unknown" : fetched.contentType) << "\n";
    if (!hints.empty()) {
        ss << "Hint:";
        for (const auto& h : hints) ss << " " << h;
        ss << "\n";
    }
    ss << "First bytes preview: " << preview;

    throw domain::InvalidContent(ss.str(), pointer, markup);
}

} // namespace hubingest::infrastructure
