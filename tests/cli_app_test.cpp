/**
 * @file    cli_app_test.cpp
 * @brief   Command-line tests for the compose subcommand
 */

#include <gtest/gtest.h>
#include "cli/cli_app.hpp"
#include "external/temp_workspace.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace nxc;

namespace {

int run_cli(std::vector<std::string> args) {
    args.insert(args.begin(), "nexus_converter");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return cli::run(static_cast<int>(argv.size()), argv.data());
}

class CliAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::scratch_dir("cli");
        source_ = dir_ / "product.png";
        watermark_ = dir_ / "logo.png";
        external::write_file(source_, test::solid_png({640, 480}, test::kOpaqueRed));
        external::write_file(watermark_, test::solid_png({200, 100}, test::kOpaqueBlue));
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
    fs::path source_;
    fs::path watermark_;
};

}  // anonymous namespace

TEST(FormatFromExtensionTest, PngOrJpeg) {
    EXPECT_EQ(cli::format_from_extension("out.png"), OutputFormat::Png);
    EXPECT_EQ(cli::format_from_extension("OUT.PNG"), OutputFormat::Png);
    EXPECT_EQ(cli::format_from_extension("out.jpg"), OutputFormat::Jpeg);
    EXPECT_EQ(cli::format_from_extension("out.webp"), OutputFormat::Jpeg);
    EXPECT_EQ(cli::format_from_extension("out"), OutputFormat::Jpeg);
}

TEST_F(CliAppTest, ComposeWritesSheet) {
    const fs::path output = dir_ / "nested" / "sheet.png";

    const int code = run_cli({"-q", "compose",
                              "-s", source_.string(),
                              "-w", watermark_.string(),
                              "-o", output.string()});

    ASSERT_EQ(code, 0);
    const cv::Mat out = test::decode(external::read_file(output));
    EXPECT_EQ(out.size(), cv::Size(800, 1000));
}

TEST_F(CliAppTest, ComposeOverlayAsJpeg) {
    const fs::path output = dir_ / "overlay.jpg";

    const int code = run_cli({"-q", "compose",
                              "-s", source_.string(),
                              "-w", watermark_.string(),
                              "-o", output.string(),
                              "--layout", "overlay", "--mode", "center",
                              "--opacity", "0.5", "--quality", "80"});

    ASSERT_EQ(code, 0);
    const Bytes data = external::read_file(output);
    ASSERT_GE(data.size(), 2u);
    EXPECT_EQ(data[0], 0xFF);
    EXPECT_EQ(data[1], 0xD8);
    EXPECT_EQ(test::decode(data).size(), cv::Size(1200, 1200));
}

TEST_F(CliAppTest, ComposeUndecodableSourceFails) {
    const fs::path junk = dir_ / "junk.png";
    external::write_file(junk, Bytes{'n', 'o'});

    const int code = run_cli({"-q", "compose",
                              "-s", junk.string(),
                              "-w", watermark_.string(),
                              "-o", (dir_ / "out.png").string()});

    EXPECT_NE(code, 0);
    EXPECT_FALSE(fs::exists(dir_ / "out.png"));
}

TEST_F(CliAppTest, MissingSourceFileIsUsageError) {
    const int code = run_cli({"-q", "compose",
                              "-s", (dir_ / "absent.png").string(),
                              "-w", watermark_.string(),
                              "-o", (dir_ / "out.png").string()});
    EXPECT_NE(code, 0);
}
