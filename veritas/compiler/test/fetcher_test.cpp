// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <veritas/compiler/bucket_fetcher.hpp>
#include <veritas/compiler/http_client.hpp>
#include <veritas/compiler/list_fetcher.hpp>
#include <veritas/core/hex.hpp>

#include <gtest/gtest.h>

using namespace veritas;

namespace
{
    Url url(std::string_view const s)
    {
        auto res = parse_url(s);
        EXPECT_FALSE(res.has_error()) << s;
        return res.value();
    }

    CompilerVersion version(std::string_view const s)
    {
        return parse_compiler_version(s).value();
    }

    constexpr auto list_json = R"({
        "builds": [
            {
                "path": "solc-linux-amd64-v0.8.19+commit.7dd6d404",
                "version": "0.8.19",
                "longVersion": "0.8.19+commit.7dd6d404",
                "sha256": "0x7a1d6f4c8ce29c1f4adea6a6a0fd2e7e1e20c8d1bf1b8a5f1d0d1a0a8a8ab7e9"
            },
            {
                "path": "https://mirror.example/solc-0.8.18",
                "longVersion": "0.8.18+commit.87f61d96",
                "sha256": "95e6ed4949a63ad89afb443ecba1fb8302dd2860ee5e9baace3e674a0f48aa77"
            },
            {
                "path": "broken",
                "longVersion": "not-a-version",
                "sha256": "00"
            },
            {
                "path": "short-hash",
                "longVersion": "0.8.17+commit.8df45f5f",
                "sha256": "0x1234"
            }
        ]
    })";
}

TEST(Url, parse_and_print)
{
    auto const u = url("https://binaries.soliditylang.org/linux-amd64/list.json");
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "binaries.soliditylang.org");
    EXPECT_EQ(u.port, "443");
    EXPECT_EQ(u.target, "/linux-amd64/list.json");
    EXPECT_EQ(u.to_string(), "https://binaries.soliditylang.org/linux-amd64/list.json");

    auto const local = url("http://localhost:9000");
    EXPECT_EQ(local.port, "9000");
    EXPECT_EQ(local.target, "/");
    EXPECT_EQ(local.to_string(), "http://localhost:9000/");

    EXPECT_TRUE(parse_url("ftp://example.org/x").has_error());
    EXPECT_TRUE(parse_url("example.org/x").has_error());
    EXPECT_TRUE(parse_url("http:///x").has_error());
}

TEST(Url, join_relative_and_absolute)
{
    auto const base = url("https://example.org/linux-amd64/list.json");
    EXPECT_EQ(
        base.join("solc-v0.8.19").to_string(),
        "https://example.org/linux-amd64/solc-v0.8.19");
    EXPECT_EQ(
        base.join("/other/solc").to_string(), "https://example.org/other/solc");
    EXPECT_EQ(
        base.join("http://mirror.example:8080/solc").to_string(),
        "http://mirror.example:8080/solc");
}

TEST(Url, encode_path)
{
    EXPECT_EQ(
        url_encode_path("v0.8.19+commit.7dd6d404/solc"),
        "v0.8.19%2Bcommit.7dd6d404/solc");
}

TEST(ListFetcher, parse_compiler_list)
{
    auto const list_url = url("https://example.org/linux-amd64/list.json");
    auto const manifest = parse_compiler_list(list_json, list_url);
    ASSERT_FALSE(manifest.has_error());
    ASSERT_EQ(manifest.value().size(), 2);

    auto const &v19 =
        manifest.value().at(version("v0.8.19+commit.7dd6d404"));
    EXPECT_EQ(
        v19.url,
        "https://example.org/linux-amd64/"
        "solc-linux-amd64-v0.8.19+commit.7dd6d404");
    ASSERT_TRUE(v19.sha256.has_value());
    EXPECT_EQ(
        to_hex(to_byte_string_view(*v19.sha256)),
        "7a1d6f4c8ce29c1f4adea6a6a0fd2e7e1e20c8d1bf1b8a5f1d0d1a0a8a8ab7e9");

    auto const &v18 =
        manifest.value().at(version("v0.8.18+commit.87f61d96"));
    EXPECT_EQ(v18.url, "https://mirror.example/solc-0.8.18");
}

TEST(ListFetcher, rejects_invalid_document)
{
    auto const list_url = url("https://example.org/list.json");
    EXPECT_EQ(
        parse_compiler_list("{", list_url).error(), FetchError::Fetch);
    EXPECT_EQ(
        parse_compiler_list(R"({"releases": {}})", list_url).error(),
        FetchError::Fetch);
}

TEST(BucketFetcher, parse_listing_and_manifest)
{
    constexpr auto xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>solc-releases</Name>
  <Prefix></Prefix>
  <KeyCount>3</KeyCount>
  <Delimiter>/</Delimiter>
  <IsTruncated>true</IsTruncated>
  <NextContinuationToken>token/1</NextContinuationToken>
  <CommonPrefixes><Prefix>v0.8.19+commit.7dd6d404/</Prefix></CommonPrefixes>
  <CommonPrefixes><Prefix>v0.8.20-nightly.2023.2.22+commit.1f8f1a3d/</Prefix></CommonPrefixes>
  <CommonPrefixes><Prefix>misc/</Prefix></CommonPrefixes>
</ListBucketResult>)";

    auto const listing = parse_bucket_listing(xml);
    ASSERT_FALSE(listing.has_error());
    EXPECT_EQ(listing.value().prefixes.size(), 3);
    ASSERT_TRUE(listing.value().continuation_token.has_value());
    EXPECT_EQ(*listing.value().continuation_token, "token/1");

    auto const manifest = make_bucket_manifest(
        url("http://storage.local:9000/solc-releases"),
        listing.value().prefixes,
        "solc");
    ASSERT_EQ(manifest.size(), 2);
    auto const &entry = manifest.at(version("v0.8.19+commit.7dd6d404"));
    EXPECT_EQ(
        entry.url,
        "http://storage.local:9000/solc-releases/"
        "v0.8.19%2Bcommit.7dd6d404/solc");
    EXPECT_EQ(
        entry.sha256_url,
        "http://storage.local:9000/solc-releases/"
        "v0.8.19%2Bcommit.7dd6d404/sha256.hash");
    EXPECT_FALSE(entry.sha256.has_value());
}

TEST(BucketFetcher, parse_listing_last_page)
{
    constexpr auto xml = R"(<ListBucketResult>
  <IsTruncated>false</IsTruncated>
  <CommonPrefixes><Prefix>v0.8.19+commit.7dd6d404/</Prefix></CommonPrefixes>
</ListBucketResult>)";
    auto const listing = parse_bucket_listing(xml);
    ASSERT_FALSE(listing.has_error());
    EXPECT_FALSE(listing.value().continuation_token.has_value());
    EXPECT_TRUE(parse_bucket_listing("<html>").has_error());
    EXPECT_TRUE(parse_bucket_listing("<Error/>").has_error());
}

TEST(BucketFetcher, parse_sha256_hash)
{
    auto const digest = parse_sha256_hash(
        "  95e6ed4949a63ad89afb443ecba1fb8302dd2860ee5e9baace3e674a0f48aa77\n");
    ASSERT_FALSE(digest.has_error());
    EXPECT_EQ(digest.value().bytes[0], 0x95);
    EXPECT_EQ(parse_sha256_hash("xyz").error(), FetchError::HashParse);
    EXPECT_EQ(parse_sha256_hash("abcd").error(), FetchError::HashParse);
}
