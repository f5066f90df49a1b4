#include "bencode/Bencode.hpp"
#include "metainfo/MetaInfo.hpp"
#include "utils/Errors.hpp"
#include "utils/SHA1.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <string>

namespace {

std::string digest(std::string_view data) {
    auto hash = SHA1::calculate(data);
    return std::string(hash.begin(), hash.end());
}

std::string bstr(const std::string& value) {
    return std::to_string(value.size()) + ":" + value;
}

// Info dictionary for a 5-byte single file "a.txt" holding "hello"
std::string singleFileInfo() {
    return "d6:lengthi5e4:name5:a.txt12:piece lengthi16384e6:pieces20:" + digest("hello") + "e";
}

std::string torrentWithInfo(const std::string& info, const std::string& extra = "") {
    return "d8:announce" + bstr("http://tracker.example/announce") + extra + "4:info" + info + "e";
}

std::string failureKey(const std::string& torrent) {
    try {
        MetaInfo::decode(torrent);
    } catch (const InvalidMetainfo& e) {
        return e.what();
    }
    ADD_FAILURE() << "torrent accepted";
    return "";
}

}

class MetaInfoTest : public ::testing::Test {
protected:
    nlohmann::json info;

    void SetUp() override {
        info = Bencode::decode(singleFileInfo());
    }

    std::string torrent() const {
        return torrentWithInfo(Bencode::encode(info));
    }
};

TEST_F(MetaInfoTest, DecodesSingleFileTorrent) {
    MetaInfo meta = MetaInfo::decode(torrentWithInfo(singleFileInfo()));

    EXPECT_EQ(meta.announce, "http://tracker.example/announce");
    EXPECT_FALSE(meta.isMultiFile());
    EXPECT_EQ(meta.name(), "a.txt");
    EXPECT_EQ(meta.totalLength(), 5);
    EXPECT_EQ(meta.pieceLength(), 16384);
    ASSERT_EQ(meta.pieceCount(), 1u);
    EXPECT_EQ(meta.pieceSize(0), 5);
    EXPECT_EQ(SHA1::toHex(meta.pieceHashes()[0]), "aaf4c61ddcc5e8a2dabede0f3b482cd9aea9434d");
    EXPECT_FALSE(meta.isPrivate());

    auto files = meta.files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].joinedPath(), "a.txt");
    EXPECT_EQ(files[0].length, 5);
}

TEST_F(MetaInfoTest, InfoHashIsDigestOfRawInfoBytes) {
    MetaInfo meta = MetaInfo::decode(torrentWithInfo(singleFileInfo()));
    EXPECT_EQ(meta.info_hash.toHex(), "de3edc1dfa1958affac1dbdc8f34d4d6dac43f00");
}

TEST_F(MetaInfoTest, InfoHashKeepsOriginalKeyOrder) {
    // Keys out of canonical order: re-encoding would change the digest
    std::string unsorted = "d4:name5:a.txt6:lengthi5e12:piece lengthi16384e6:pieces20:" + digest("hello") + "e";
    MetaInfo meta = MetaInfo::decode(torrentWithInfo(unsorted));
    EXPECT_EQ(meta.info_hash.toHex(), "210756f19887e95426cc44f12a7b47081e620771");
}

TEST_F(MetaInfoTest, DecodesMultiFileTorrent) {
    std::string pieces = digest("abcd") + digest("efg");
    std::string multi = "d5:filesld6:lengthi3e4:pathl3:dir5:x.binee"
                        "d6:lengthi4e4:pathl5:y.bineee"
                        "4:name4:pack12:piece lengthi4e6:pieces40:" + pieces + "e";
    MetaInfo meta = MetaInfo::decode(torrentWithInfo(multi));

    EXPECT_TRUE(meta.isMultiFile());
    EXPECT_EQ(meta.name(), "pack");
    EXPECT_EQ(meta.totalLength(), 7);
    EXPECT_EQ(meta.pieceCount(), 2u);
    EXPECT_EQ(meta.pieceSize(0), 4);
    EXPECT_EQ(meta.pieceSize(1), 3);
    EXPECT_EQ(meta.info_hash.toHex(), "b0bb740a0a0667f4b19e9b3a7607cb2031648fc0");

    auto files = meta.files();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].joinedPath(), "dir/x.bin");
    EXPECT_EQ(files[1].joinedPath(), "y.bin");
}

TEST_F(MetaInfoTest, DecodesOptionalTopLevelFields) {
    std::string extra = "13:announce-listll" + bstr("http://a/") + bstr("http://b/") + "el" +
                        bstr("http://tracker.example/announce") + "ee" +
                        "7:comment" + bstr("test torrent") +
                        "10:created by" + bstr("bitswarm") +
                        "13:creation datei1700000000e" +
                        "8:encoding" + bstr("UTF-8");
    std::string torrent = "d8:announce" + bstr("http://tracker.example/announce") + extra +
                          "4:info" + singleFileInfo() + "7:unknowni1e" + "8:url-list" + bstr("http://seed/") + "e";
    MetaInfo meta = MetaInfo::decode(torrent);

    EXPECT_EQ(meta.announce_list, (std::vector<std::string>{"http://a/", "http://b/", "http://tracker.example/announce"}));
    EXPECT_EQ(meta.trackers(), (std::vector<std::string>{"http://tracker.example/announce", "http://a/", "http://b/"}));
    EXPECT_EQ(meta.comment, "test torrent");
    EXPECT_EQ(meta.created_by, "bitswarm");
    EXPECT_EQ(meta.creation_date, 1700000000);
    EXPECT_EQ(meta.encoding, "UTF-8");
    EXPECT_EQ(meta.url_list, std::vector<std::string>{"http://seed/"});

    std::string description = meta.describe(false);
    EXPECT_NE(description.find("Creation date: 2023-11-14 22:13:20"), std::string::npos);
    EXPECT_NE(description.find("Info Hash: de3edc1dfa1958affac1dbdc8f34d4d6dac43f00"), std::string::npos);
}

TEST_F(MetaInfoTest, PrivateMeansEqualToOne) {
    info["private"] = 1;
    EXPECT_TRUE(MetaInfo::decode(torrent()).isPrivate());
    info["private"] = 2;
    EXPECT_FALSE(MetaInfo::decode(torrent()).isPrivate());
    info["private"] = 300;
    EXPECT_THROW(MetaInfo::decode(torrent()), InvalidMetainfo);
}

TEST_F(MetaInfoTest, RejectsMissingRequiredKeys) {
    EXPECT_NE(failureKey("d4:info" + singleFileInfo() + "e").find("announce"), std::string::npos);
    EXPECT_NE(failureKey("d8:announce3:urle").find("info"), std::string::npos);

    for (const char* key : {"name", "piece length", "pieces"}) {
        SetUp();
        info.erase(key);
        EXPECT_NE(failureKey(torrent()).find(key), std::string::npos) << key;
    }
}

TEST_F(MetaInfoTest, RejectsLengthAndFilesTogetherOrNeither) {
    info.erase("length");
    EXPECT_THROW(MetaInfo::decode(torrent()), InvalidMetainfo);

    SetUp();
    info["files"] = nlohmann::json::array({{{"length", 5}, {"path", nlohmann::json::array({"a"})}}});
    EXPECT_THROW(MetaInfo::decode(torrent()), InvalidMetainfo);
}

TEST_F(MetaInfoTest, InfoIsClosedSchema) {
    info["source"] = "somewhere";
    EXPECT_NE(failureKey(torrent()).find("source"), std::string::npos);
}

TEST_F(MetaInfoTest, RejectsBadPieces) {
    info["pieces"] = std::string(19, 'x');
    EXPECT_NE(failureKey(torrent()).find("pieces"), std::string::npos);

    // Two hashes for a payload that fits one piece
    SetUp();
    info["pieces"] = digest("hello") + digest("hello");
    EXPECT_THROW(MetaInfo::decode(torrent()), InvalidMetainfo);

    SetUp();
    info["piece length"] = 0;
    EXPECT_THROW(MetaInfo::decode(torrent()), InvalidMetainfo);
}

TEST_F(MetaInfoTest, RejectsEmptyPathAndUnknownFileKeys) {
    info.erase("length");
    info["files"] = nlohmann::json::array({{{"length", 5}, {"path", nlohmann::json::array()}}});
    EXPECT_NE(failureKey(torrent()).find("path"), std::string::npos);

    info["files"] = nlohmann::json::array(
        {{{"length", 5}, {"path", nlohmann::json::array({"a"})}, {"attr", "x"}}});
    EXPECT_NE(failureKey(torrent()).find("attr"), std::string::npos);
}

TEST_F(MetaInfoTest, ZeroLengthPayloadHasNoPieces) {
    info["length"] = 0;
    info["pieces"] = "";
    MetaInfo meta = MetaInfo::decode(torrent());
    EXPECT_EQ(meta.pieceCount(), 0u);
    EXPECT_EQ(meta.totalLength(), 0);
}

TEST_F(MetaInfoTest, HugeLengthsDoNotOverflow) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();

    // Piece count is computed without rounding past the int64 range
    info["length"] = max;
    info["piece length"] = 2;
    EXPECT_NE(failureKey(torrent()).find("pieces holds 1 hashes"), std::string::npos);

    info["piece length"] = max;
    MetaInfo meta = MetaInfo::decode(torrent());
    EXPECT_EQ(meta.totalLength(), max);
    EXPECT_EQ(meta.pieceCount(), 1u);

    nlohmann::json files = nlohmann::json::array();
    for (int i = 0; i < 3; i++) {
        files.push_back({{"length", int64_t{1} << 62}, {"path", {"part" + std::to_string(i)}}});
    }
    info.erase("length");
    info["files"] = files;
    EXPECT_NE(failureKey(torrent()).find("payload length overflows"), std::string::npos);
}

TEST_F(MetaInfoTest, MalformedBencodeIsInvalidMetainfo) {
    EXPECT_THROW(MetaInfo::decode("d8:announce"), InvalidMetainfo);
    EXPECT_THROW(MetaInfo::decode("le"), InvalidMetainfo);
}
