#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <glob.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>
#include "errors.hpp"
#include "test_helpers.hpp"
#include "video_assembler.hpp"

class VideoAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_temp_dir("petriwatch_video_run");
        bin_dir = make_temp_dir("petriwatch_video_bin");
    }

    void TearDown() override {
        std::filesystem::remove_all(run_dir);
        std::filesystem::remove_all(bin_dir);
    }

    void touch(const std::string& name) { std::ofstream(run_dir / name) << "jpeg"; }

    VideoAssembler ffmpeg_assembler() {
        return VideoAssembler(std::make_unique<FfmpegEncoder>(cfg, CommandResolver(bin_dir.string())));
    }

    std::filesystem::path run_dir;
    std::filesystem::path bin_dir;
    VideoConfig cfg;
};

TEST_F(VideoAssemblerTest, ListsJpegsInFilenameOrder) {
    touch("20260101_120010_00002.jpg");
    touch("20260101_120000_00000.jpg");
    touch("20260101_120005_00001.jpg");
    touch("settings.json");
    touch("notes.txt");
    std::filesystem::create_directories(run_dir / "nested.jpg");

    auto frames = VideoAssembler::list_frames(run_dir);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].filename(), "20260101_120000_00000.jpg");
    EXPECT_EQ(frames[1].filename(), "20260101_120005_00001.jpg");
    EXPECT_EQ(frames[2].filename(), "20260101_120010_00002.jpg");
}

TEST_F(VideoAssemblerTest, EmptyDirectoryFails) {
    write_script(bin_dir, "ffmpeg", "exit 0");
    auto assembler = ffmpeg_assembler();
    try {
        assembler.assemble(run_dir, 25, "timelapse.mp4");
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_NE(std::string(e.what()).find("No images found"), std::string::npos);
    }
}

TEST_F(VideoAssemblerTest, MissingDirectoryFails) {
    auto assembler = ffmpeg_assembler();
    EXPECT_THROW(assembler.assemble(run_dir / "missing", 25, "out.mp4"), EncodingError);
}

TEST_F(VideoAssemblerTest, NonPositiveFrameRateFails) {
    touch("a.jpg");
    auto assembler = ffmpeg_assembler();
    EXPECT_THROW(assembler.assemble(run_dir, 0, "out.mp4"), EncodingError);
}

TEST_F(VideoAssemblerTest, MissingEncoderBinaryFails) {
    touch("a.jpg");
    auto assembler = ffmpeg_assembler();
    try {
        assembler.assemble(run_dir, 25, "out.mp4");
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_STREQ(e.what(), "Encoder 'ffmpeg' not found");
    }
}

TEST_F(VideoAssemblerTest, EncoderFailureIsReported) {
    touch("a.jpg");
    write_script(bin_dir, "ffmpeg", "exit 1");
    auto assembler = ffmpeg_assembler();
    try {
        assembler.assemble(run_dir, 25, "out.mp4");
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_STREQ(e.what(), "Encoder failed: exit code 1");
    }
}

TEST_F(VideoAssemblerTest, EncoderThatWritesNothingFails) {
    touch("a.jpg");
    write_script(bin_dir, "ffmpeg", "exit 0");
    auto assembler = ffmpeg_assembler();
    EXPECT_THROW(assembler.assemble(run_dir, 25, "out.mp4"), EncodingError);
}

TEST_F(VideoAssemblerTest, SuccessfulEncodeLandsInRunDirectory) {
    touch("a.jpg");
    touch("b.jpg");
    // Writes the last argument, the output path.
    write_script(bin_dir, "ffmpeg", "for last; do :; done\ntouch \"$last\"");
    auto assembler = ffmpeg_assembler();

    auto video = assembler.assemble(run_dir, 10, "timelapse.mp4");
    EXPECT_EQ(video, run_dir / "timelapse.mp4");
    EXPECT_TRUE(std::filesystem::exists(video));
}

TEST_F(VideoAssemblerTest, AbsoluteOutputPathIsKept) {
    touch("a.jpg");
    write_script(bin_dir, "ffmpeg", "for last; do :; done\ntouch \"$last\"");
    auto assembler = ffmpeg_assembler();

    auto target = bin_dir / "elsewhere.mp4";
    EXPECT_EQ(assembler.assemble(run_dir, 10, target.string()), target);
    EXPECT_TRUE(std::filesystem::exists(target));
}

TEST_F(VideoAssemblerTest, FfmpegCommandLine) {
    cfg.codec = "libx264";
    cfg.pixel_format = "yuv420p";
    FfmpegEncoder encoder(cfg, CommandResolver(bin_dir.string()));
    auto argv = encoder.command_line("/usr/bin/ffmpeg", "/runs/a", 25, "/runs/a/t.mp4");
    std::vector<std::string> expected{"/usr/bin/ffmpeg", "-y", "-loglevel", "error",
                                      "-framerate", "25", "-pattern_type", "glob",
                                      "-i", "/runs/a/*.jpg", "-c:v", "libx264",
                                      "-pix_fmt", "yuv420p", "/runs/a/t.mp4"};
    EXPECT_EQ(argv, expected);
}

TEST_F(VideoAssemblerTest, FfmpegPatternEscapesDirectory) {
    FfmpegEncoder encoder(cfg, CommandResolver(bin_dir.string()));
    auto argv = encoder.command_line("/usr/bin/ffmpeg", "/runs/plate[1]_x", 25, "/runs/t.mp4");
    ASSERT_EQ(argv.size(), 15u);
    EXPECT_EQ(argv[9], "/runs/plate\\[1\\]_x/*.jpg");
    EXPECT_EQ(escape_glob("a*b?c\\d"), "a\\*b\\?c\\\\d");
    EXPECT_EQ(escape_glob("plain_name"), "plain_name");
}

TEST_F(VideoAssemblerTest, EscapedPatternMatchesFramesInBracketedDirectory) {
    const auto plate = run_dir / "plate[1]_20260101_120000";
    std::filesystem::create_directories(plate);
    std::ofstream(plate / "20260101_120000_00001.jpg") << "jpeg";
    std::ofstream(plate / "20260101_120100_00002.jpg") << "jpeg";

    FfmpegEncoder encoder(cfg, CommandResolver(bin_dir.string()));
    const auto pattern = encoder.command_line("ffmpeg", plate, 25, "out.mp4")[9];

    glob_t g{};
    ASSERT_EQ(glob(pattern.c_str(), 0, nullptr, &g), 0);
    EXPECT_EQ(g.gl_pathc, 2u);
    globfree(&g);
}

TEST_F(VideoAssemblerTest, AssemblesInBracketedRunDirectory) {
    const auto plate = run_dir / "plate[1]_20260101_120000";
    std::filesystem::create_directories(plate);
    std::ofstream(plate / "20260101_120000_00001.jpg") << "jpeg";
    std::ofstream(plate / "20260101_120100_00002.jpg") << "jpeg";
    // Records the -i argument, then writes the output.
    const auto seen = bin_dir / "input_pattern.txt";
    write_script(bin_dir, "ffmpeg",
                 "printf '%s' \"$9\" > '" + seen.string() + "'\n"
                 "for last; do :; done\ntouch \"$last\"");
    auto assembler = ffmpeg_assembler();

    auto video = assembler.assemble(plate, 10, "timelapse.mp4");
    EXPECT_TRUE(std::filesystem::exists(video));

    const std::string pattern = read_file(seen);
    glob_t g{};
    ASSERT_EQ(glob(pattern.c_str(), 0, nullptr, &g), 0) << pattern;
    EXPECT_EQ(g.gl_pathc, 2u);
    globfree(&g);
}

TEST_F(VideoAssemblerTest, CreateEncoderByName) {
    CommandResolver resolver(bin_dir.string());
    cfg.encoder = "ffmpeg";
    EXPECT_EQ(create_encoder(cfg, resolver)->name(), "ffmpeg");
    cfg.encoder = "opencv";
    EXPECT_EQ(create_encoder(cfg, resolver)->name(), "opencv");
    cfg.encoder = "gstreamer";
    EXPECT_THROW(create_encoder(cfg, resolver), ConfigurationError);
}

TEST_F(VideoAssemblerTest, OpenCvEncoderWritesVideo) {
    for (int i = 0; i < 3; ++i) {
        cv::Mat frame(48, 64, CV_8UC3, cv::Scalar(20 * i, 100, 200));
        cv::imwrite((run_dir / ("frame_" + std::to_string(i) + ".jpg")).string(), frame);
    }
    cfg.fourcc = "MJPG";
    VideoAssembler assembler(std::make_unique<OpenCvEncoder>(cfg));

    auto video = assembler.assemble(run_dir, 5, "timelapse.avi");
    EXPECT_TRUE(std::filesystem::exists(video));
    EXPECT_GT(std::filesystem::file_size(video), 0u);
}

TEST_F(VideoAssemblerTest, OpenCvEncoderRejectsUnreadableFrames) {
    touch("broken.jpg");
    cfg.fourcc = "MJPG";
    VideoAssembler assembler(std::make_unique<OpenCvEncoder>(cfg));
    EXPECT_THROW(assembler.assemble(run_dir, 5, "timelapse.avi"), EncodingError);
}
