/**
 * @file test_images.cpp
 * @brief Tests for image descriptions and downloads
 */

#include <geminiweb/errors.hpp>
#include <geminiweb/images.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include "mock_transport.hpp"

using namespace geminiweb;
using namespace geminiweb::testing;

TEST(ImageTest, DescribeShortensLongUrls) {
    WebImage image("https://example.com/" + std::string(60, 'a') + ".jpg", "Cat", "a cat");

    std::string text = image.describe();
    EXPECT_EQ(text.rfind("WebImage(title='Cat', url='https://example.com/", 0), 0u);
    EXPECT_NE(text.find("..."), std::string::npos);
    EXPECT_NE(text.find("alt='a cat')"), std::string::npos);
}

TEST(ImageTest, WebImageFetchesAnonymously) {
    MockTransport transport([](const HttpRequest&) { return HttpResponse{200, "bytes", {}}; });
    WebImage image("https://example.com/cat.jpg");

    std::vector<uint8_t> data = image.fetch_bytes(transport);

    EXPECT_EQ(std::string(data.begin(), data.end()), "bytes");
    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "https://example.com/cat.jpg");
    EXPECT_TRUE(requests[0].cookies.empty());
}

TEST(ImageTest, GeneratedImageUsesCookiesAndFullSize) {
    MockTransport transport([](const HttpRequest&) { return HttpResponse{200, "png", {}}; });
    GeneratedImage image("https://lh3.googleusercontent.com/gen", "[Generated Image 1]", "", {{"__Secure-1PSID", "sid"}});

    image.fetch_bytes(transport);
    image.set_full_size(false);
    image.fetch_bytes(transport);

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].url, "https://lh3.googleusercontent.com/gen=s2048");
    EXPECT_EQ(requests[0].cookies.at("__Secure-1PSID"), "sid");
    EXPECT_EQ(requests[1].url, "https://lh3.googleusercontent.com/gen");
}

TEST(ImageTest, FailedDownloadIsApiError) {
    MockTransport transport([](const HttpRequest&) { return HttpResponse{403, "", {}}; });
    WebImage image("https://example.com/cat.jpg");

    try {
        image.fetch_bytes(transport);
        FAIL() << "Expected APIError";
    } catch (const APIError& e) {
        EXPECT_EQ(e.status_code(), 403);
    }
}

TEST(ImageTest, SaveWritesFile) {
    MockTransport transport([](const HttpRequest&) { return HttpResponse{200, "jpegdata", {}}; });
    WebImage image("https://example.com/photos/cat.jpg?size=large");
    auto directory = std::filesystem::temp_directory_path() / "geminiweb_image_test";
    std::filesystem::remove_all(directory);

    std::string path = image.save(transport, directory.string());

    EXPECT_EQ(std::filesystem::path(path).filename().string(), "cat.jpg");
    std::ifstream file(path, std::ios::binary);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "jpegdata");

    std::filesystem::remove_all(directory);
}

TEST(ImageTest, SaveRejectsNamesWithoutExtension) {
    MockTransport transport([](const HttpRequest&) { return HttpResponse{200, "x", {}}; });
    WebImage image("https://example.com/cat.jpg");

    EXPECT_THROW(image.save(transport, "unused", std::string("noextension")), ValidationError);
    EXPECT_TRUE(transport.requests().empty());
}
