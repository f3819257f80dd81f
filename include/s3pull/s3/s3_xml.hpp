#pragma once

/*
 * Readers for the handful of S3 XML responses s3pull consumes: ListAllMyBucketsResult,
 * ListBucketResult (ListObjectsV2) and the <Error> document.
 */

#include <s3pull/core/types.hpp>
#include <s3pull/transfer/transfer.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace s3pull::s3 {

// Resolves the five predefined entities and numeric character references
std::string xmlUnescape(std::string_view text);

// Unescaped text of the first <tag>...</tag> in xml
std::optional<std::string> firstTag(std::string_view xml, std::string_view tag);

std::vector<std::string> parseBucketNames(std::string_view xml);

struct ListObjectsPage {
    std::vector<transfer::RemoteObject> objects;
    std::string nextContinuationToken;
    bool truncated{false};
};

/**
 * One ListObjectsV2 page. ETags are unquoted; a <Contents> entry without <Key> or with a
 * non-numeric <Size> is an error.
 */
Expected<ListObjectsPage> parseListObjectsPage(std::string_view xml, std::string_view bucket);

} // namespace s3pull::s3
