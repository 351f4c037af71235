#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "fetch.hpp"


/**
 * Downloader which records the requests instead of downloading.
 */
class RecordingDownloader : public Downloader {
public:
    std::filesystem::path fetch(std::string_view url,
                                const std::filesystem::path& destination) override {
        requested_url = url;
        requested_destination = destination;
        ++calls;
        return destination;
    }

    std::string requested_url;
    std::filesystem::path requested_destination;
    int calls = 0;
};

class FailingDownloader : public Downloader {
public:
    std::filesystem::path fetch(std::string_view url, const std::filesystem::path&) override {
        throw std::runtime_error("Connection refused: " + std::string(url));
    }
};


TEST(FetchCrust2, TestDefaultDestination) {
    RecordingDownloader downloader;
    auto result = fetch_crust2(downloader);
    EXPECT_EQ(downloader.calls, 1);
    EXPECT_EQ(downloader.requested_url, "http://igpppublic.ucsd.edu/~gabi/ftp/crust2.tar.gz");
    EXPECT_EQ(downloader.requested_destination.string(), "crust2.tar.gz");
    EXPECT_EQ(result.string(), "crust2.tar.gz");
}

TEST(FetchCrust2, TestCustomDestination) {
    RecordingDownloader downloader;
    auto result = fetch_crust2(downloader, "models/crust.tgz");
    EXPECT_EQ(downloader.requested_destination.string(), "models/crust.tgz");
    EXPECT_EQ(result.string(), "models/crust.tgz");
}

TEST(FetchCrust2, TestDownloaderErrorsArePropagated) {
    FailingDownloader downloader;
    EXPECT_THROW(fetch_crust2(downloader), std::runtime_error);
}
