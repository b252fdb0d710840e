#include "io/webdav/webdav_client.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace momento {
namespace {
constexpr const char* kNextcloudListing = R"(<?xml version="1.0"?>
<d:multistatus xmlns:d="DAV:" xmlns:oc="http://owncloud.org/ns">
  <d:response>
    <d:href>/remote.php/dav/files/me/Photos/</d:href>
    <d:propstat><d:prop><d:resourcetype><d:collection/></d:resourcetype></d:prop></d:propstat>
  </d:response>
  <d:response>
    <d:href>/remote.php/dav/files/me/Photos/IMG%200001.JPG</d:href>
    <d:propstat><d:prop>
      <d:resourcetype/>
      <d:getcontentlength>2048</d:getcontentlength>
    </d:prop></d:propstat>
  </d:response>
  <d:response>
    <d:href>https://cloud.example.com/remote.php/dav/files/me/Photos/2024</d:href>
    <d:propstat><d:prop><d:resourcetype><d:collection/></d:resourcetype></d:prop></d:propstat>
  </d:response>
</d:multistatus>)";
}  // namespace

TEST(WebDavClientTest, ParsesMultistatusEntries) {
  auto entries = WebDavClient::ParseMultistatus(kNextcloudListing);
  ASSERT_EQ(entries.size(), 3u);

  EXPECT_EQ(entries[0].path_, "/remote.php/dav/files/me/Photos/");
  EXPECT_TRUE(entries[0].is_collection_);

  EXPECT_EQ(entries[1].path_, "/remote.php/dav/files/me/Photos/IMG 0001.JPG");
  EXPECT_FALSE(entries[1].is_collection_);
  EXPECT_EQ(entries[1].size_, 2048);

  EXPECT_EQ(entries[2].path_, "/remote.php/dav/files/me/Photos/2024");
  EXPECT_TRUE(entries[2].is_collection_);
  EXPECT_FALSE(entries[2].size_.has_value());
}

TEST(WebDavClientTest, UnparseableContentLengthIsUnknown) {
  constexpr const char* kListing = R"(<?xml version="1.0"?>
<d:multistatus xmlns:d="DAV:">
  <d:response><d:href>/dav/huge.jpg</d:href>
    <d:propstat><d:prop><d:getcontentlength>99999999999999999999</d:getcontentlength></d:prop></d:propstat>
  </d:response>
  <d:response><d:href>/dav/odd.jpg</d:href>
    <d:propstat><d:prop><d:getcontentlength>12abc</d:getcontentlength></d:prop></d:propstat>
  </d:response>
  <d:response><d:href>/dav/padded.jpg</d:href>
    <d:propstat><d:prop><d:getcontentlength> 512 </d:getcontentlength></d:prop></d:propstat>
  </d:response>
</d:multistatus>)";

  std::vector<WebDavEntry> entries;
  ASSERT_NO_THROW(entries = WebDavClient::ParseMultistatus(kListing));
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_FALSE(entries[0].size_.has_value());
  EXPECT_FALSE(entries[1].size_.has_value());
  EXPECT_EQ(entries[2].size_, 512);
}

TEST(WebDavClientTest, RejectsNonMultistatusBodies) {
  EXPECT_THROW(WebDavClient::ParseMultistatus("<html><body>login</body></html>"), WebDavError);
  EXPECT_THROW(WebDavClient::ParseMultistatus("not xml at all"), WebDavError);
}

TEST(WebDavClientTest, PathNormalization) {
  EXPECT_EQ(WebDavClient::NormalizePath(""), "/");
  EXPECT_EQ(WebDavClient::NormalizePath("photos"), "/photos");
  EXPECT_EQ(WebDavClient::NormalizePath("//photos\\2024//jan"), "/photos/2024/jan");
  EXPECT_EQ(WebDavClient::EncodePath("/a b/c&d.jpg"), "/a%20b/c%26d.jpg");
  EXPECT_EQ(WebDavClient::DecodePath("/a%20b/c%26d.jpg"), "/a b/c&d.jpg");
  EXPECT_EQ(WebDavClient::DecodePath("/100%"), "/100%");
}

TEST(WebDavClientTest, RootPathJoinsUrlPathAndConfiguredRoot) {
  WebDavConfig config;
  config.url_       = "https://cloud.example.com/remote.php/dav/files/me";
  config.root_path_ = "Photos/";
  WebDavClient client(config);
  EXPECT_EQ(client.RootPath(), "/remote.php/dav/files/me/Photos/");

  config.url_ = "cloud.example.com";
  EXPECT_THROW(WebDavClient{config}, WebDavError);
}

TEST(WebDavClientTest, UnreachableServerIsReportedAsWebDavError) {
  WebDavConfig config;
  config.url_             = "http://127.0.0.1:1/dav";
  config.timeout_seconds_ = 2;
  WebDavClient client(config);
  EXPECT_THROW(client.CheckConnection(), WebDavError);
}

TEST(WebDavClientTest, DownloadStreamsToDiskAndCleansUpOnHttpError) {
  httplib::Server server;
  server.Get("/dav/photo.jpg", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("jpeg-bytes", "image/jpeg");
  });
  const int   port = server.bind_to_any_port("127.0.0.1");
  std::thread listener([&server]() { server.listen_after_bind(); });
  server.wait_until_ready();

  auto dir = std::filesystem::temp_directory_path() / "momento_webdav_client_test";
  std::filesystem::remove_all(dir);

  WebDavConfig config;
  config.url_ = "http://127.0.0.1:" + std::to_string(port) + "/dav";
  WebDavClient client(config);

  client.Download("/dav/photo.jpg", dir / "photo.jpg");
  {
    std::ifstream in(dir / "photo.jpg", std::ios::binary);
    std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "jpeg-bytes");
  }

  EXPECT_THROW(client.Download("/dav/missing.jpg", dir / "missing.jpg"), WebDavError);
  EXPECT_FALSE(std::filesystem::exists(dir / "missing.jpg"));

  server.stop();
  listener.join();
  std::filesystem::remove_all(dir);
}
};  // namespace momento
