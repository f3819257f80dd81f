#include <s3pull/s3/s3_errors.hpp>
#include <s3pull/s3/s3_xml.hpp>

#include <charconv>
#include <cstdint>

namespace s3pull::s3 {

namespace {

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::optional<std::uint32_t> parseCharRef(std::string_view ref) {
    int base = 10;
    if (!ref.empty() && (ref.front() == 'x' || ref.front() == 'X')) {
        base = 16;
        ref.remove_prefix(1);
    }
    std::uint32_t cp = 0;
    const auto* end = ref.data() + ref.size();
    auto [ptr, ec] = std::from_chars(ref.data(), end, cp, base);
    if (ref.empty() || ec != std::errc{} || ptr != end || cp > 0x10FFFF)
        return std::nullopt;
    return cp;
}

// Splits xml into the bodies of every <tag>...</tag> element (no nesting of the same tag)
std::vector<std::string_view> elementBodies(std::string_view xml, std::string_view tag) {
    const std::string open = "<" + std::string(tag) + ">";
    const std::string close = "</" + std::string(tag) + ">";
    std::vector<std::string_view> out;
    std::size_t pos = 0;
    while (true) {
        const auto start = xml.find(open, pos);
        if (start == std::string_view::npos)
            break;
        const auto bodyStart = start + open.size();
        const auto end = xml.find(close, bodyStart);
        if (end == std::string_view::npos)
            break;
        out.push_back(xml.substr(bodyStart, end - bodyStart));
        pos = end + close.size();
    }
    return out;
}

} // namespace

std::string xmlUnescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out.push_back(text[i]);
            continue;
        }
        const auto semi = text.find(';', i + 1);
        if (semi == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        const auto entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp") {
            out.push_back('&');
        } else if (entity == "lt") {
            out.push_back('<');
        } else if (entity == "gt") {
            out.push_back('>');
        } else if (entity == "quot") {
            out.push_back('"');
        } else if (entity == "apos") {
            out.push_back('\'');
        } else if (!entity.empty() && entity.front() == '#') {
            auto cp = parseCharRef(entity.substr(1));
            if (!cp) {
                out.append(text.substr(i, semi - i + 1));
            } else {
                appendUtf8(out, *cp);
            }
        } else {
            out.append(text.substr(i, semi - i + 1));
        }
        i = semi;
    }
    return out;
}

std::optional<std::string> firstTag(std::string_view xml, std::string_view tag) {
    auto bodies = elementBodies(xml, tag);
    if (bodies.empty())
        return std::nullopt;
    return xmlUnescape(bodies.front());
}

std::vector<std::string> parseBucketNames(std::string_view xml) {
    std::vector<std::string> names;
    for (auto body : elementBodies(xml, "Bucket")) {
        if (auto name = firstTag(body, "Name"))
            names.push_back(std::move(*name));
    }
    return names;
}

Expected<ListObjectsPage> parseListObjectsPage(std::string_view xml, std::string_view bucket) {
    ListObjectsPage page;
    for (auto body : elementBodies(xml, "Contents")) {
        auto key = firstTag(body, "Key");
        if (!key) {
            return Error{ErrorCode::Unknown,
                         "ListObjectsV2 response for " + std::string(bucket) +
                             " has an entry without <Key>"};
        }

        transfer::RemoteObject obj;
        obj.bucket = std::string(bucket);
        obj.key = std::move(*key);
        if (auto size = firstTag(body, "Size")) {
            const auto* end = size->data() + size->size();
            auto [ptr, ec] = std::from_chars(size->data(), end, obj.size);
            if (ec != std::errc{} || ptr != end) {
                return Error{ErrorCode::Unknown,
                             "Unreadable <Size> '" + *size + "' for key " + obj.key};
            }
        }
        if (auto etag = firstTag(body, "ETag"); etag && !etag->empty())
            obj.etag = std::string(unquoteEtag(*etag));
        page.objects.push_back(std::move(obj));
    }

    page.truncated = firstTag(xml, "IsTruncated").value_or("false") == "true";
    page.nextContinuationToken = firstTag(xml, "NextContinuationToken").value_or("");
    return page;
}

} // namespace s3pull::s3
