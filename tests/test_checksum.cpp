#include <gtest/gtest.h>

#include "dsfetch/checksum.hpp"
#include "dsfetch/errors.hpp"
#include "support/temp_dir.hpp"

using namespace dsfetch;
using dsfetch::test::TempDir;
using dsfetch::test::writeFile;

TEST(ChecksumParseTest, PrefixedForms) {
    const auto md5 = Checksum::parse("md5:5EB63BBBE01EEED093CB22BB8F5ACDC3");
    ASSERT_TRUE(md5);
    EXPECT_EQ(md5->algorithm, DigestAlgorithm::Md5);
    EXPECT_EQ(md5->hex, "5eb63bbbe01eeed093cb22bb8f5acdc3");

    const auto sha = Checksum::parse("SHA256:b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    ASSERT_TRUE(sha);
    EXPECT_EQ(sha->algorithm, DigestAlgorithm::Sha256);
}

TEST(ChecksumParseTest, BareHexInfersAlgorithm) {
    EXPECT_EQ(Checksum::parse("5eb63bbbe01eeed093cb22bb8f5acdc3")->algorithm, DigestAlgorithm::Md5);
    EXPECT_EQ(Checksum::parse("2aae6c35c94fcfb415dbe95f408b9ce91ee846ed")->algorithm, DigestAlgorithm::Sha1);
}

TEST(ChecksumParseTest, RejectsUnsupportedInput) {
    EXPECT_FALSE(Checksum::parse("crc32:deadbeef"));
    EXPECT_FALSE(Checksum::parse("md5:not-hex"));
    EXPECT_FALSE(Checksum::parse("abc"));
    EXPECT_FALSE(Checksum::parse(""));
}

TEST(ChecksumDigestTest, KnownDigests) {
    TempDir dir;
    writeFile(dir / "hello.txt", "hello world");

    EXPECT_EQ(computeFileDigest(dir / "hello.txt", DigestAlgorithm::Md5),
              "5eb63bbbe01eeed093cb22bb8f5acdc3");
    EXPECT_EQ(computeFileDigest(dir / "hello.txt", DigestAlgorithm::Sha1),
              "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed");
    EXPECT_EQ(computeFileDigest(dir / "hello.txt", DigestAlgorithm::Sha256),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(ChecksumDigestTest, EmptyFileDigest) {
    TempDir dir;
    writeFile(dir / "empty", "");
    EXPECT_EQ(computeFileDigest(dir / "empty", DigestAlgorithm::Md5),
              "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ChecksumDigestTest, VerifyDetectsMismatch) {
    TempDir dir;
    writeFile(dir / "hello.txt", "hello world");

    EXPECT_TRUE(verifyChecksum(dir / "hello.txt", *Checksum::parse("md5:5eb63bbbe01eeed093cb22bb8f5acdc3")));
    EXPECT_FALSE(verifyChecksum(dir / "hello.txt", *Checksum::parse("md5:d41d8cd98f00b204e9800998ecf8427e")));
}

TEST(ChecksumDigestTest, MissingFileIsStorageError) {
    TempDir dir;
    EXPECT_THROW((void)computeFileDigest(dir / "absent", DigestAlgorithm::Md5), StorageError);
}
