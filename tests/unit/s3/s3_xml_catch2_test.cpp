#include <catch2/catch_test_macros.hpp>

#include <s3pull/s3/s3_xml.hpp>

using namespace s3pull;
using namespace s3pull::s3;

TEST_CASE("xmlUnescape", "[s3][xml]") {
    CHECK(xmlUnescape("a &amp; b") == "a & b");
    CHECK(xmlUnescape("&lt;&gt;&quot;&apos;") == "<>\"'");
    CHECK(xmlUnescape("&#65;&#x42;") == "AB");
    CHECK(xmlUnescape("&#xE9;") == "\xC3\xA9");
    CHECK(xmlUnescape("&unknown; &") == "&unknown; &");
}

TEST_CASE("parseBucketNames", "[s3][xml]") {
    const char* xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListAllMyBucketsResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Owner><ID>abc</ID><DisplayName>owner</DisplayName></Owner>
  <Buckets>
    <Bucket><Name>alpha</Name><CreationDate>2024-01-01T00:00:00.000Z</CreationDate></Bucket>
    <Bucket><CreationDate>2024-01-02T00:00:00.000Z</CreationDate><Name>cloudtrail-logs-prod</Name></Bucket>
  </Buckets>
</ListAllMyBucketsResult>)";

    auto names = parseBucketNames(xml);
    REQUIRE(names.size() == 2);
    CHECK(names[0] == "alpha");
    CHECK(names[1] == "cloudtrail-logs-prod");
    CHECK(parseBucketNames("<ListAllMyBucketsResult><Buckets/></ListAllMyBucketsResult>").empty());
}

TEST_CASE("parseListObjectsPage", "[s3][xml]") {
    const char* xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>b</Name><KeyCount>3</KeyCount><IsTruncated>true</IsTruncated>
  <NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>
  <Contents><Key>docs/a&amp;b.txt</Key><Size>1234</Size><ETag>&quot;5eb63bbbe01eeed093cb22bb8f5acdc3&quot;</ETag></Contents>
  <Contents><Key>docs/</Key><Size>0</Size><ETag>"d41d8cd98f00b204e9800998ecf8427e"</ETag></Contents>
  <Contents><Key>big.bin</Key><Size>20000000</Size><ETag>"9b2cf535f27731c974343645a3985328-3"</ETag></Contents>
</ListBucketResult>)";

    auto page = parseListObjectsPage(xml, "b");
    REQUIRE(page.ok());
    const auto& p = page.value();
    CHECK(p.truncated);
    CHECK(p.nextContinuationToken == "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");
    REQUIRE(p.objects.size() == 3);
    CHECK(p.objects[0].bucket == "b");
    CHECK(p.objects[0].key == "docs/a&b.txt");
    CHECK(p.objects[0].size == 1234);
    CHECK(p.objects[0].etag == std::optional<std::string>{"5eb63bbbe01eeed093cb22bb8f5acdc3"});
    CHECK(p.objects[1].isDirectoryMarker());
    CHECK(p.objects[2].size == 20000000);
    CHECK(p.objects[2].etag == std::optional<std::string>{"9b2cf535f27731c974343645a3985328-3"});
}

TEST_CASE("parseListObjectsPage: last and malformed pages", "[s3][xml]") {
    auto last = parseListObjectsPage(
        "<ListBucketResult><IsTruncated>false</IsTruncated></ListBucketResult>", "b");
    REQUIRE(last.ok());
    CHECK_FALSE(last.value().truncated);
    CHECK(last.value().objects.empty());

    auto noKey = parseListObjectsPage("<Contents><Size>1</Size></Contents>", "b");
    CHECK_FALSE(noKey.ok());

    auto badSize = parseListObjectsPage("<Contents><Key>k</Key><Size>-1</Size></Contents>", "b");
    CHECK_FALSE(badSize.ok());
}

TEST_CASE("firstTag on error documents", "[s3][xml]") {
    const char* xml = "<Error><Code>NoSuchKey</Code><Message>The specified key does not "
                      "exist.</Message></Error>";
    CHECK(firstTag(xml, "Code") == std::optional<std::string>{"NoSuchKey"});
    CHECK(firstTag(xml, "Message") == std::optional<std::string>{"The specified key does not exist."});
    CHECK_FALSE(firstTag(xml, "RequestId").has_value());
}
