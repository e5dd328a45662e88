#include "BaseTestFixture.h"
#include "src/core/ConversionEngine.h"

#include <algorithm>

class ConversionEngineTest : public BaseTestFixture {
protected:
    std::vector<std::string> logLines;

    ConversionSummary run(const ConversionRequest& request) {
        ConversionEngine engine([this](ConversionEngine::LogLevel, const std::string& line) {
            logLines.push_back(line);
        });
        return engine.convert(request);
    }

    static std::vector<std::string> fileNames(const fs::path& dir) {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    static cv::Vec3b pixelAt(const fs::path& image, int x, int y) {
        cv::Mat img = cv::imread(image.string(), cv::IMREAD_COLOR);
        EXPECT_FALSE(img.empty()) << image.string();
        return img.empty() ? cv::Vec3b() : img.at<cv::Vec3b>(y, x);
    }
};

TEST_F(ConversionEngineTest, ProducesOneResultPerMatchingFile) {
    writeOpaqueWebp("a.webp");
    writeOpaqueWebp("B.WEBP");
    writeOpaqueWebp("c.Webp");
    touch(sourceDir / "notes.txt");
    touch(sourceDir / "photo.png");
    touch(sourceDir / "webp");
    fs::create_directory(sourceDir / "nested");
    writeOpaqueWebp("nested/d.webp");

    ConversionSummary summary = run(makeRequest());

    ASSERT_EQ(summary.results.size(), 3u);
    EXPECT_EQ(summary.converted, 3);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_EQ(summary.skipped, 0);
    // Byte order: uppercase sorts first
    EXPECT_EQ(summary.results[0].sourcePath.filename().string(), "B.WEBP");
    EXPECT_EQ(summary.results[1].sourcePath.filename().string(), "a.webp");
    EXPECT_EQ(summary.results[2].sourcePath.filename().string(), "c.Webp");
}

TEST_F(ConversionEngineTest, CorruptFileDoesNotAbortBatch) {
    writeOpaqueWebp("a.webp");
    writeCorruptWebp("b.webp");
    writeOpaqueWebp("c.webp");

    ConversionSummary summary = run(makeRequest());

    ASSERT_EQ(summary.results.size(), 3u);
    EXPECT_EQ(summary.converted, 2);
    EXPECT_EQ(summary.failed, 1);

    const ConversionResult& bad = summary.results[1];
    EXPECT_EQ(bad.sourcePath.filename().string(), "b.webp");
    EXPECT_EQ(bad.status, ConversionStatus::FAILED);
    EXPECT_FALSE(bad.outputPath.has_value());
    EXPECT_FALSE(bad.errorDetail.empty());
    EXPECT_TRUE(fs::exists(sourceDir / "b.webp"));

    EXPECT_EQ(summary.results[0].status, ConversionStatus::CONVERTED);
    EXPECT_EQ(summary.results[2].status, ConversionStatus::CONVERTED);
}

TEST_F(ConversionEngineTest, PngKeepsAlphaChannel) {
    writeTransparentWebp("alpha.webp");
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;
    request.preserveTransparency = true;

    ConversionSummary summary = run(request);
    ASSERT_EQ(summary.converted, 1);

    cv::Mat out = cv::imread((outputDir / "alpha.png").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(out.empty());
    ASSERT_EQ(out.channels(), 4);

    cv::Mat expected = transparentPattern();
    std::vector<cv::Mat> outChannels, expectedChannels;
    cv::split(out, outChannels);
    cv::split(expected, expectedChannels);
    EXPECT_EQ(cv::countNonZero(outChannels[3] != expectedChannels[3]), 0);

    // Opaque area keeps its colour
    cv::Vec4b opaque = out.at<cv::Vec4b>(2, expected.cols - 2);
    EXPECT_EQ(opaque, cv::Vec4b(255, 0, 0, 255));
}

TEST_F(ConversionEngineTest, JpegFlattensOntoWhite) {
    writeTransparentWebp("alpha.webp");
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;
    request.targetFormat = TargetFormat::JPEG;

    ConversionSummary summary = run(request);
    ASSERT_EQ(summary.converted, 1);
    ASSERT_TRUE(summary.results[0].outputPath.has_value());
    EXPECT_EQ(summary.results[0].outputPath->filename().string(), "alpha.jpg");

    cv::Mat out = cv::imread((outputDir / "alpha.jpg").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.channels(), 3);

    cv::Vec3b background = out.at<cv::Vec3b>(2, 2);
    for (int c = 0; c < 3; ++c) {
        EXPECT_GE(background[c], 240) << "channel " << c;
    }
}

TEST_F(ConversionEngineTest, PngWithoutTransparencyIsOpaque) {
    writeTransparentWebp("alpha.webp");
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;
    request.preserveTransparency = false;

    ASSERT_EQ(run(request).converted, 1);

    cv::Mat out = cv::imread((outputDir / "alpha.png").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.channels(), 3);
    EXPECT_EQ(out.at<cv::Vec3b>(2, 2), cv::Vec3b(255, 255, 255));
}

TEST_F(ConversionEngineTest, OpaqueSourceGivesOpaquePng) {
    writeOpaqueWebp("solid.webp", cv::Scalar(10, 200, 30));
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;

    ASSERT_EQ(run(request).converted, 1);

    cv::Mat out = cv::imread((outputDir / "solid.png").string(), cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.channels(), 3);
    EXPECT_EQ(out.at<cv::Vec3b>(0, 0), cv::Vec3b(10, 200, 30));
}

TEST_F(ConversionEngineTest, SequentialNamesFollowFilenameOrder) {
    writeOpaqueWebp("c.webp", cv::Scalar(0, 0, 255));
    writeOpaqueWebp("a.webp", cv::Scalar(0, 255, 0));
    writeOpaqueWebp("b.webp", cv::Scalar(255, 0, 0));

    ConversionSummary summary = run(makeRequest());
    ASSERT_EQ(summary.converted, 3);

    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"image_001.png", "image_002.png", "image_003.png"}));
    EXPECT_EQ(pixelAt(outputDir / "image_001.png", 0, 0), cv::Vec3b(0, 255, 0));
    EXPECT_EQ(pixelAt(outputDir / "image_002.png", 0, 0), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(pixelAt(outputDir / "image_003.png", 0, 0), cv::Vec3b(0, 0, 255));
}

TEST_F(ConversionEngineTest, KeepOriginalNamesReplacesExtension) {
    writeOpaqueWebp("holiday.webp");
    writeOpaqueWebp("Portrait.WEBP");
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;

    ASSERT_EQ(run(request).converted, 2);
    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"Portrait.png", "holiday.png"}));
}

TEST_F(ConversionEngineTest, FailedFilesDoNotConsumeSequenceNumbers) {
    writeOpaqueWebp("a.webp", cv::Scalar(0, 255, 0));
    writeCorruptWebp("b.webp");
    writeOpaqueWebp("c.webp", cv::Scalar(0, 0, 255));

    ConversionSummary summary = run(makeRequest());
    EXPECT_EQ(summary.converted, 2);
    EXPECT_EQ(summary.failed, 1);

    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"image_001.png", "image_002.png"}));
    EXPECT_EQ(pixelAt(outputDir / "image_002.png", 0, 0), cv::Vec3b(0, 0, 255));
}

TEST_F(ConversionEngineTest, CustomPrefixAndStartNumber) {
    writeOpaqueWebp("a.webp");
    writeOpaqueWebp("b.webp");
    ConversionRequest request = makeRequest();
    request.prefix = "photo";
    request.startNumber = 7;
    request.targetFormat = TargetFormat::JPEG;

    ASSERT_EQ(run(request).converted, 2);
    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"photo_007.jpg", "photo_008.jpg"}));
}

TEST_F(ConversionEngineTest, DeletesOnlySuccessfullyConvertedSources) {
    writeOpaqueWebp("good.webp");
    writeCorruptWebp("bad.webp");
    ConversionRequest request = makeRequest();
    request.deleteOriginalsOnSuccess = true;

    ConversionSummary summary = run(request);
    EXPECT_EQ(summary.converted, 1);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.deletionWarnings, 0);

    EXPECT_FALSE(fs::exists(sourceDir / "good.webp"));
    EXPECT_TRUE(fs::exists(sourceDir / "bad.webp"));
}

TEST_F(ConversionEngineTest, WriteFailureKeepsSourceAndIsolatesFile) {
    writeOpaqueWebp("a.webp");
    writeOpaqueWebp("b.webp");
    fs::create_directories(outputDir / "a.png");
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;
    request.deleteOriginalsOnSuccess = true;

    ConversionSummary summary = run(request);
    ASSERT_EQ(summary.results.size(), 2u);

    const ConversionResult& failed = summary.results[0];
    EXPECT_EQ(failed.status, ConversionStatus::FAILED);
    EXPECT_FALSE(failed.outputPath.has_value());
    EXPECT_FALSE(failed.errorDetail.empty());
    EXPECT_TRUE(fs::exists(sourceDir / "a.webp"));
    EXPECT_TRUE(fs::is_directory(outputDir / "a.png"));

    EXPECT_EQ(summary.results[1].status, ConversionStatus::CONVERTED);
    EXPECT_FALSE(fs::exists(sourceDir / "b.webp"));
    EXPECT_EQ(summary.converted, 1);
    EXPECT_EQ(summary.failed, 1);
}

TEST_F(ConversionEngineTest, FailedDeletionIsAWarning) {
    writeOpaqueWebp("a.webp");
    fs::permissions(sourceDir, fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
                    fs::perm_options::remove);
    {
        // Privileged users can still write; nothing to observe then
        std::ofstream check(sourceDir / "writable.check");
        if (check) {
            check.close();
            fs::remove(sourceDir / "writable.check");
            fs::permissions(sourceDir, fs::perms::owner_all, fs::perm_options::add);
            GTEST_SKIP() << "source directory stays writable for this user";
        }
    }

    ConversionRequest request = makeRequest();
    request.deleteOriginalsOnSuccess = true;
    ConversionSummary summary = run(request);

    fs::permissions(sourceDir, fs::perms::owner_all, fs::perm_options::add);

    ASSERT_EQ(summary.results.size(), 1u);
    EXPECT_EQ(summary.results[0].status, ConversionStatus::CONVERTED);
    EXPECT_NE(summary.results[0].warning.find("could not delete original file a.webp"), std::string::npos);
    EXPECT_EQ(summary.converted, 1);
    EXPECT_EQ(summary.deletionWarnings, 1);
    EXPECT_TRUE(fs::exists(sourceDir / "a.webp"));
    EXPECT_TRUE(fs::exists(outputDir / "image_001.png"));
}

TEST_F(ConversionEngineTest, KeepsSourcesWhenDeletionNotRequested) {
    writeOpaqueWebp("good.webp");
    ASSERT_EQ(run(makeRequest()).converted, 1);
    EXPECT_TRUE(fs::exists(sourceDir / "good.webp"));
}

TEST_F(ConversionEngineTest, RerunProducesIdenticalBytes) {
    writeTransparentWebp("one.webp");
    writeOpaqueWebp("two.webp", cv::Scalar(40, 80, 120));

    for (TargetFormat format : {TargetFormat::PNG, TargetFormat::JPEG}) {
        ConversionRequest request = makeRequest();
        request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;
        request.targetFormat = format;
        const std::string ext = extensionFor(format);

        ASSERT_EQ(run(request).converted, 2);
        auto firstOne = readBytes(outputDir / ("one" + ext));
        auto firstTwo = readBytes(outputDir / ("two" + ext));

        ASSERT_EQ(run(request).converted, 2);
        EXPECT_EQ(readBytes(outputDir / ("one" + ext)), firstOne);
        EXPECT_EQ(readBytes(outputDir / ("two" + ext)), firstTwo);
        EXPECT_FALSE(firstOne.empty());
    }
}

TEST_F(ConversionEngineTest, ContinuesNumberingAfterExistingOutputs) {
    writeOpaqueWebp("a.webp");
    writeOpaqueWebp("b.webp");

    ASSERT_EQ(run(makeRequest()).converted, 2);
    ASSERT_EQ(run(makeRequest()).converted, 2);

    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{
        "image_001.png", "image_002.png", "image_003.png", "image_004.png"}));
}

TEST_F(ConversionEngineTest, RestartsNumberingWhenContinueDisabled) {
    writeOpaqueWebp("a.webp");
    ConversionRequest request = makeRequest();
    request.continueNumbering = false;

    ASSERT_EQ(run(request).converted, 1);
    ASSERT_EQ(run(request).converted, 1);
    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"image_001.png"}));
}

TEST_F(ConversionEngineTest, OverwritesExistingOutput) {
    writeOpaqueWebp("a.webp");
    fs::create_directories(outputDir);
    touch(outputDir / "a.png");
    ConversionRequest request = makeRequest();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;

    ASSERT_EQ(run(request).converted, 1);
    cv::Mat out = cv::imread((outputDir / "a.png").string());
    EXPECT_FALSE(out.empty());
}

TEST_F(ConversionEngineTest, DirectoryMatchingFilterIsSkipped) {
    fs::create_directory(sourceDir / "album.webp");
    writeOpaqueWebp("real.webp");

    ConversionSummary summary = run(makeRequest());
    ASSERT_EQ(summary.results.size(), 2u);
    EXPECT_EQ(summary.results[0].sourcePath.filename().string(), "album.webp");
    EXPECT_EQ(summary.results[0].status, ConversionStatus::SKIPPED_NOT_AN_IMAGE);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(summary.converted, 1);
    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"image_001.png"}));
}

TEST_F(ConversionEngineTest, MissingSourceIsFatal) {
    ConversionRequest request = makeRequest();
    request.sourceFolder = tempDir / "does_not_exist";

    EXPECT_THROW(run(request), FatalConfigurationError);
    EXPECT_FALSE(fs::exists(outputDir));
}

TEST_F(ConversionEngineTest, SourceThatIsAFileIsFatal) {
    touch(tempDir / "plain.txt");
    ConversionRequest request = makeRequest();
    request.sourceFolder = tempDir / "plain.txt";

    EXPECT_THROW(run(request), FatalConfigurationError);
}

TEST_F(ConversionEngineTest, UncreatableDestinationIsFatal) {
    writeOpaqueWebp("a.webp");
    touch(tempDir / "blocker");
    ConversionRequest request = makeRequest();
    request.destinationFolder = tempDir / "blocker" / "out";

    EXPECT_THROW(run(request), FatalConfigurationError);
    EXPECT_TRUE(fs::exists(sourceDir / "a.webp"));
}

TEST_F(ConversionEngineTest, StartNumberAboveLimitIsFatal) {
    writeOpaqueWebp("a.webp");
    writeOpaqueWebp("b.webp");
    ConversionRequest request = makeRequest();
    request.startNumber = 2147483647;

    EXPECT_THROW(run(request), FatalConfigurationError);
    EXPECT_FALSE(fs::exists(outputDir));
}

TEST_F(ConversionEngineTest, LargestStartNumberStillCounts) {
    writeOpaqueWebp("a.webp");
    writeOpaqueWebp("b.webp");
    ConversionRequest request = makeRequest();
    request.startNumber = 999999999;

    ASSERT_EQ(run(request).converted, 2);
    EXPECT_EQ(fileNames(outputDir), (std::vector<std::string>{"image_1000000000.png", "image_999999999.png"}));
}

TEST_F(ConversionEngineTest, PrefixWithSeparatorIsFatal) {
    writeOpaqueWebp("a.webp");
    ConversionRequest request = makeRequest();
    request.prefix = "sub/photo";

    EXPECT_THROW(run(request), FatalConfigurationError);
    EXPECT_TRUE(fs::exists(sourceDir / "a.webp"));
}

TEST_F(ConversionEngineTest, CreatesMissingDestination) {
    writeOpaqueWebp("a.webp");
    ConversionRequest request = makeRequest();
    request.destinationFolder = tempDir / "deep" / "nested" / "out";

    ConversionSummary summary = run(request);
    EXPECT_EQ(summary.converted, 1);
    EXPECT_TRUE(fs::exists(request.destinationFolder / "image_001.png"));

    bool logged = std::any_of(logLines.begin(), logLines.end(), [](const std::string& line) {
        return line.rfind("Created directory: ", 0) == 0;
    });
    EXPECT_TRUE(logged);
}

TEST_F(ConversionEngineTest, InPlaceWithOriginalNamesWarnsAndKeepsSources) {
    writeOpaqueWebp("a.webp");
    ConversionRequest request = makeRequest();
    request.destinationFolder.clear();
    request.namingPolicy = NamingPolicy::KEEP_ORIGINAL_NAME;

    ConversionSummary summary = run(request);
    EXPECT_EQ(summary.converted, 1);
    EXPECT_TRUE(fs::exists(sourceDir / "a.webp"));
    EXPECT_TRUE(fs::exists(sourceDir / "a.png"));

    bool warned = std::any_of(logLines.begin(), logLines.end(), [](const std::string& line) {
        return line.find("in place") != std::string::npos;
    });
    EXPECT_TRUE(warned);
}

TEST_F(ConversionEngineTest, EmptyFolderYieldsEmptySummary) {
    touch(sourceDir / "readme.txt");
    ConversionSummary summary = run(makeRequest());
    EXPECT_EQ(summary.total(), 0);
    EXPECT_TRUE(summary.results.empty());
}

TEST_F(ConversionEngineTest, LogsEachFile) {
    writeOpaqueWebp("a.webp");
    writeCorruptWebp("b.webp");
    run(makeRequest());

    auto contains = [this](const std::string& needle) {
        return std::any_of(logLines.begin(), logLines.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    };
    EXPECT_TRUE(contains("Converted: a.webp -> image_001.png"));
    EXPECT_TRUE(contains("Error processing b.webp"));
}

TEST(ConversionEngineNaming, SequentialNamePadsToThreeDigits) {
    EXPECT_EQ(ConversionEngine::sequentialName("image", 1, ".png"), "image_001.png");
    EXPECT_EQ(ConversionEngine::sequentialName("img", 42, ".jpg"), "img_042.jpg");
    EXPECT_EQ(ConversionEngine::sequentialName("img", 1234, ".jpg"), "img_1234.jpg");
}
