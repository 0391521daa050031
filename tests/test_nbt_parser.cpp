/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt_parser.h"
#include "utils/fs_utils.h"

#include "nbt_test_utils.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using nbt2dict::NbtParser;
using nbt2dict::ParserDecodeOptions;
using nbt2dict::nbt::ErrorKind;
using nbt2dict::nbt::NbtError;
using nbt2dict::nbt::TagType;
using nbt2dict::test::NbtWriter;

namespace {

class NbtParserFiles : public ::testing::Test {
   protected:
    void SetUp() override {
        _dir = fs::temp_directory_path()
               / ("nbt2dict_test_" + std::string(::testing::UnitTest::GetInstance()
                                                      ->current_test_info()
                                                      ->name()));
        fs::remove_all(_dir);
        fs::create_directories(_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(_dir, ec);
    }

    fs::path write(const std::string& name, const std::vector<std::uint8_t>& bytes) {
        const fs::path p = _dir / name;
        fs::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary);
        f.write(
            reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())
        );
        return p;
    }

    fs::path _dir;
};

std::vector<std::uint8_t> player_sample() {
    NbtWriter w;
    w.named(TagType::Compound, "Player");
    w.named(TagType::String, "Name").str("Steve");
    w.named(TagType::List, "Pos").type(TagType::Double).i32(3).f64(1.0).f64(64.0).f64(-3.5);
    w.end();
    return w.bytes();
}

}  // namespace

TEST(NbtParser, DecodeBytesBuildsTreeAndJson) {
    const auto bytes = player_sample();
    const auto res = NbtParser::DecodeNbtBytes(bytes);
    EXPECT_EQ(res.root.name, "Player");
    EXPECT_EQ(res.root.compound().at("Name").get<TagType::String>(), "Steve");
    EXPECT_EQ(res.json.at("Player").at("Pos").size(), 3u);
    EXPECT_EQ(res.consumed_bytes, bytes.size());
    EXPECT_EQ(res.trailing_bytes, 0u);
}

TEST(NbtParser, TypedJsonOption) {
    ParserDecodeOptions opt;
    opt.typed_json = true;
    const auto res = NbtParser::DecodeNbtBytes(player_sample(), opt);
    EXPECT_EQ(res.json.at("Player").at("__type"), "Compound");
}

TEST(NbtParser, StrictOptionRejectsPadding) {
    auto bytes = player_sample();
    bytes.insert(bytes.end(), 16, 0x00);

    const auto lenient = NbtParser::DecodeNbtBytes(bytes);
    EXPECT_EQ(lenient.trailing_bytes, 16u);

    ParserDecodeOptions opt;
    opt.allow_trailing_bytes = false;
    try {
        NbtParser::DecodeNbtBytes(bytes, opt);
        FAIL() << "expected TrailingBytes";
    } catch (const NbtError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TrailingBytes);
    }
}

TEST(NbtParser, MaxDepthOption) {
    NbtWriter w;
    w.named(TagType::Compound, "").named(TagType::Compound, "a").end().end();
    ParserDecodeOptions opt;
    opt.max_depth = 0;
    EXPECT_THROW(NbtParser::DecodeNbtBytes(w.bytes(), opt), NbtError);
    opt.max_depth = 1;
    EXPECT_NO_THROW(NbtParser::DecodeNbtBytes(w.bytes(), opt));
}

TEST(NbtParser, DebugLogsNameTheInput) {
    auto bytes = player_sample();
    bytes.push_back(0x00);
    ParserDecodeOptions opt;
    opt.debug = true;

    ::testing::internal::CaptureStdout();
    NbtParser::DecodeNbtBytes(bytes, opt, "chunk r.0.0");
    const std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("Decoding chunk r.0.0 ("), std::string::npos);
    EXPECT_NE(out.find("Decoded chunk r.0.0: root='Player' children=2"), std::string::npos);
    EXPECT_NE(out.find("Ignored 1 trailing bytes after root compound in chunk r.0.0"),
              std::string::npos);
}

TEST(NbtParser, QuietWithoutDebug) {
    ::testing::internal::CaptureStdout();
    NbtParser::DecodeNbtBytes(player_sample(), {}, "quiet");
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

TEST_F(NbtParserFiles, DecodeFile) {
    const auto path = write("level.dat", player_sample());
    const auto res = NbtParser::DecodeNbtFile(path);
    EXPECT_EQ(res.root.name, "Player");
}

TEST_F(NbtParserFiles, EmptyFileIsTruncatedInput) {
    const auto path = write("empty.nbt", {});
    try {
        NbtParser::DecodeNbtFile(path);
        FAIL() << "expected UnexpectedEndOfInput";
    } catch (const NbtError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnexpectedEndOfInput);
        EXPECT_EQ(e.offset(), 0u);
        EXPECT_EQ(std::string(e.what()).rfind("UnexpectedEndOfInput at offset 0", 0), 0u);
    }
}

TEST_F(NbtParserFiles, DebugLabelIsTheFilePath) {
    const auto path = write("level.dat", player_sample());
    ParserDecodeOptions opt;
    opt.debug = true;
    ::testing::internal::CaptureStdout();
    NbtParser::DecodeNbtFile(path, opt);
    const std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("Decoding " + path.string()), std::string::npos);
}

TEST_F(NbtParserFiles, MissingFileIsRejected) {
    EXPECT_THROW(NbtParser::DecodeNbtFile(_dir / "missing.nbt"), std::runtime_error);
}

TEST_F(NbtParserFiles, CollectInputsFindsNbtFilesSorted) {
    write("b.nbt", player_sample());
    write("sub/a.dat", player_sample());
    write("notes.txt", {0x01});
    const auto inputs = nbt2dict::fs_utils::collect_inputs(_dir);
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].filename(), "b.nbt");
    EXPECT_EQ(inputs[1].filename(), "a.dat");
}

TEST_F(NbtParserFiles, WriteTextFileCreatesParents) {
    const fs::path out = _dir / "out" / "json" / "x.json";
    nbt2dict::fs_utils::write_text_file(out, "{}");
    const auto bytes = nbt2dict::fs_utils::read_file(out);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "{}");
}

TEST_F(NbtParserFiles, WriteTextFileReplacesContents) {
    const fs::path out = _dir / "x.json";
    nbt2dict::fs_utils::write_text_file(out, "{\"long\":[1,2,3]}");
    nbt2dict::fs_utils::write_text_file(out, "{}");
    const auto bytes = nbt2dict::fs_utils::read_file(out);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "{}");
}

TEST_F(NbtParserFiles, EnsureDirFailsUnderAFile) {
    const auto blocker = write("blocker", {0x01});
    EXPECT_THROW(nbt2dict::fs_utils::ensure_dir(blocker / "sub"), std::runtime_error);
    EXPECT_NO_THROW(nbt2dict::fs_utils::ensure_dir(_dir / "a" / "b"));
    EXPECT_TRUE(fs::is_directory(_dir / "a" / "b"));
}

TEST(FsUtils, ExecutableDirIsAnExistingDirectory) {
    const auto dir = nbt2dict::fs_utils::executable_dir("nbt2dict_tests");
    EXPECT_FALSE(dir.empty());
    EXPECT_TRUE(fs::is_directory(dir));
}

TEST(FsUtils, RecognisesNbtExtensions) {
    EXPECT_TRUE(nbt2dict::fs_utils::is_nbt_file("world/level.dat"));
    EXPECT_TRUE(nbt2dict::fs_utils::is_nbt_file("servers.nbt"));
    EXPECT_FALSE(nbt2dict::fs_utils::is_nbt_file("region/r.0.0.mca"));
    EXPECT_FALSE(nbt2dict::fs_utils::is_nbt_file("level.dat_old"));
}
