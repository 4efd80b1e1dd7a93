#include "gateway/metadata_translator.hpp"
#include "core/config.h"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {

class MetadataTranslatorTest : public ::testing::Test {
protected:
    std::string translate(const std::string& query) {
        MetadataTranslator translator(config, client);
        return translator.translate(parse_query(query)).str();
    }

    GatewayConfig config;
    FakeUpstreamClient client;
};

} // namespace

TEST(UpstreamTypeTest, MapsPublicTypes) {
    EXPECT_EQ(upstream_type("search"), std::string("search"));
    EXPECT_EQ(upstream_type("url"), std::string("url"));
    EXPECT_EQ(upstream_type("lyric"), std::string("lrc"));
    EXPECT_EQ(upstream_type("pic"), std::string("pic"));
    EXPECT_FALSE(upstream_type("lrc"));
    EXPECT_FALSE(upstream_type("playlist"));
    EXPECT_FALSE(upstream_type(""));
}

TEST(UpstreamTypeTest, SearchIsUnsigned) {
    EXPECT_FALSE(requires_signature("search"));
    EXPECT_TRUE(requires_signature("url"));
    EXPECT_TRUE(requires_signature("lrc"));
    EXPECT_TRUE(requires_signature("pic"));
}

TEST_F(MetadataTranslatorTest, SearchUsesNameAndNoSignature) {
    EXPECT_EQ(translate("types=search&name=Adele&id=ignored"),
              "https://api.i-meto.com/meting/api?server=netease&type=search&id=Adele");
}

TEST_F(MetadataTranslatorTest, SearchTermIsFormEncoded) {
    EXPECT_EQ(translate("types=search&name=Taylor%20Swift%20%26%20Co"),
              "https://api.i-meto.com/meting/api?server=netease&type=search&id=Taylor+Swift+%26+Co");
}

TEST_F(MetadataTranslatorTest, UrlIsSigned) {
    EXPECT_EQ(translate("types=url&id=12345"),
              "https://api.i-meto.com/meting/api?server=netease&type=url&id=12345"
              "&auth=f4b7754fb9527cd423cd93f297420735fa7f8999");
}

TEST_F(MetadataTranslatorTest, LyricBecomesLrc) {
    EXPECT_EQ(translate("types=lyric&id=1974443814"),
              "https://api.i-meto.com/meting/api?server=netease&type=lrc&id=1974443814"
              "&auth=4917d2c4f3330e53d0d313ec25c7536fdf3f00bd");
}

TEST_F(MetadataTranslatorTest, SourceSelectsServer) {
    EXPECT_EQ(translate("types=pic&id=0039MnYb0qxYhV&source=tencent"),
              "https://api.i-meto.com/meting/api?server=tencent&type=pic&id=0039MnYb0qxYhV"
              "&auth=bf918e3729c2eb88537ac6ea6cd52e594288d917");
}

TEST_F(MetadataTranslatorTest, ClientAuthIsPassedThrough) {
    EXPECT_EQ(translate("types=url&id=12345&auth=deadbeef"),
              "https://api.i-meto.com/meting/api?server=netease&type=url&id=12345&auth=deadbeef");
}

TEST_F(MetadataTranslatorTest, EmptyValuesCountAsMissing) {
    EXPECT_EQ(translate("types=url&id=12345&auth=&source="),
              "https://api.i-meto.com/meting/api?server=netease&type=url&id=12345"
              "&auth=f4b7754fb9527cd423cd93f297420735fa7f8999");
}

TEST_F(MetadataTranslatorTest, MissingIdSignsEmptyString) {
    SignatureGenerator signer("meting-secret");
    EXPECT_EQ(translate("types=pic"),
              "https://api.i-meto.com/meting/api?server=netease&type=pic&id=&auth=" +
              signer.sign("netease", "pic", ""));
}

TEST_F(MetadataTranslatorTest, UnknownTypesGiveBareBaseUrl) {
    EXPECT_EQ(translate("types=playlist&id=1"), "https://api.i-meto.com/meting/api");
    EXPECT_EQ(translate(""), "https://api.i-meto.com/meting/api");
}

TEST_F(MetadataTranslatorTest, BaseQueryIsKept) {
    config.api_base_url = "http://localhost:3000/api?format=json";
    EXPECT_EQ(translate("types=search&name=x"),
              "http://localhost:3000/api?format=json&server=netease&type=search&id=x");
}

TEST_F(MetadataTranslatorTest, RelaysUpstreamAnswer) {
    boost::asio::io_context io;
    auto sink = std::make_shared<RecordingSink>(io);
    MetadataTranslator translator(config, client);

    auto request = make_request("GET", "/?types=search&name=Adele", {{"User-Agent", "TestAgent/1.0"}});
    translator.handle(request, parse_query(request.query()), sink);

    ASSERT_EQ(client.calls.size(), 1u);
    FakeCall& call = client.last();
    EXPECT_EQ(call.request.method, "GET");
    EXPECT_EQ(*find_header(call.request.headers, "User-Agent"), "TestAgent/1.0");
    EXPECT_EQ(*find_header(call.request.headers, "Accept"), "application/json");

    call.respond_head(200, {{"Content-Type", "application/json"}, {"Set-Cookie", "a=b"}});
    call.respond_chunk("[]");
    sink->complete_write(true);
    call.respond_complete();

    EXPECT_EQ(sink->status, 200);
    EXPECT_EQ(sink->body, "[]");
    EXPECT_TRUE(sink->finished);
    EXPECT_EQ(sink->header("Cache-Control"), "no-store");
    EXPECT_EQ(sink->header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(sink->header("Set-Cookie"), "");
    EXPECT_EQ(call.reads_requested, 1);
}

TEST_F(MetadataTranslatorTest, MissingContentTypeBecomesJson) {
    boost::asio::io_context io;
    auto sink = std::make_shared<RecordingSink>(io);
    MetadataTranslator translator(config, client);

    auto request = make_request("HEAD", "/?types=url&id=1");
    translator.handle(request, parse_query(request.query()), sink);

    FakeCall& call = client.last();
    EXPECT_EQ(call.request.method, "GET");
    EXPECT_EQ(*find_header(call.request.headers, "User-Agent"), "Mozilla/5.0");

    call.respond_head(200, {});
    EXPECT_EQ(sink->header("Content-Type"), "application/json; charset=utf-8");
}
