/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "meshq/fingerprint.hpp"

using namespace meshq;

TEST(FingerprintTest, KnownDigests) {
    EXPECT_EQ(fingerprint(std::string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(fingerprint(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(FingerprintTest, IdenticalBytesMatchDistinctBytesDiffer) {
    std::string a = "solid cube\nendsolid cube\n";
    std::string b = a;
    std::string c = a + " ";

    EXPECT_EQ(fingerprint(a), fingerprint(b));
    EXPECT_NE(fingerprint(a), fingerprint(c));
    EXPECT_TRUE(isFingerprint(fingerprint(a)));
}

TEST(FingerprintTest, StreamMatchesBufferAcrossChunks) {
    std::string data;
    for (int i = 0; i < 200000; ++i) {
        data.push_back(static_cast<char>(i * 31 % 251));
    }
    std::istringstream in(data);

    auto streamed = fingerprint(in);
    ASSERT_TRUE(streamed.has_value());
    EXPECT_EQ(*streamed, fingerprint(data));
}

TEST(FingerprintTest, FailedStreamYieldsNothing) {
    std::istringstream in("payload");
    in.setstate(std::ios::badbit);
    EXPECT_FALSE(fingerprint(in).has_value());
}

TEST(FingerprintTest, ValidatesHexForm) {
    EXPECT_FALSE(isFingerprint(""));
    EXPECT_FALSE(isFingerprint(std::string(63, 'a')));
    EXPECT_FALSE(isFingerprint(std::string(64, 'A')));
    EXPECT_FALSE(isFingerprint(std::string(64, 'g')));
    EXPECT_TRUE(isFingerprint(std::string(64, 'f')));
}

TEST(FingerprintTest, ReferencesRoundTrip) {
    Fingerprint fp = fingerprint(std::string("mesh"));

    EXPECT_EQ(inputRefFor(fp), "uploads/input-" + fp + ".stl");
    EXPECT_EQ(outputRefFor(fp), "output-" + fp + ".png");

    auto recovered = fingerprintFromInputRef(inputRefFor(fp));
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, fp);
}

TEST(FingerprintTest, RejectsForeignInputReferences) {
    EXPECT_FALSE(fingerprintFromInputRef("uploads/input-.stl").has_value());
    EXPECT_FALSE(fingerprintFromInputRef("uploads/model.stl").has_value());
    EXPECT_FALSE(fingerprintFromInputRef("uploads/input-" + std::string(64, 'z') + ".stl").has_value());
    EXPECT_FALSE(fingerprintFromInputRef("uploads/input-" + std::string(64, 'a') + ".obj").has_value());
}
