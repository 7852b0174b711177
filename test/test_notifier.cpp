#include <gtest/gtest.h>

#include "fakes.h"
#include "ridesafe/notifier.h"

using ridesafe::Fault;
using ridesafe::HttpResponse;
using ridesafe::TelegramNotifier;
using ridesafe::urlEncode;
using ridesafe::fakes::FakeHttpClient;

TEST(UrlEncodeTest, KeepsUnreservedCharacters) {
  EXPECT_EQ(urlEncode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST(UrlEncodeTest, EscapesEverythingElse) {
  EXPECT_EQ(urlEncode("Helmet Fall Detected!\nA&b"), "Helmet%20Fall%20Detected%21%0AA%26b");
  EXPECT_EQ(urlEncode("http://maps.google.com/?q=1,2"),
            "http%3A%2F%2Fmaps.google.com%2F%3Fq%3D1%2C2");
  EXPECT_EQ(urlEncode("m/s^2"), "m%2Fs%5E2");
}

TEST(TelegramNotifierTest, PostsFormEncodedMessage) {
  FakeHttpClient http;
  HttpResponse ok = {200, "{\"ok\":true}", ""};
  http.postResponses.push_back(ok);
  TelegramNotifier notifier(http, "123:ABC", "6046574860");

  EXPECT_EQ(notifier.send("Fall at 12:00"), Fault::NONE);

  ASSERT_EQ(http.posts.size(), 1u);
  EXPECT_EQ(http.posts[0].url, "https://api.telegram.org/bot123:ABC/sendMessage");
  EXPECT_EQ(http.posts[0].detail, "chat_id=6046574860&text=Fall%20at%2012%3A00");
}

TEST(TelegramNotifierTest, AnyHttpResponseCountsAsSent) {
  FakeHttpClient http;
  HttpResponse rejected = {401, "{\"ok\":false}", ""};
  http.postResponses.push_back(rejected);
  TelegramNotifier notifier(http, "token", "42");

  EXPECT_EQ(notifier.send("hello"), Fault::NONE);
}

TEST(TelegramNotifierTest, TransportErrorIsNotifyFailure) {
  FakeHttpClient http;
  TelegramNotifier notifier(http, "token", "42");

  EXPECT_EQ(notifier.send("hello"), Fault::NOTIFY_FAILURE);
  EXPECT_EQ(http.posts.size(), 1u);
}
