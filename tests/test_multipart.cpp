/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <string>

#include "meshq/multipart.hpp"

using namespace meshq;

namespace {
const std::string kType = "multipart/form-data; boundary=----meshqBoundary42";

std::string formBody(const std::string& payload) {
    return "------meshqBoundary42\r\n"
           "Content-Disposition: form-data; name=\"note\"\r\n"
           "\r\n"
           "hello\r\n"
           "------meshqBoundary42\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"part.stl\"\r\n"
           "Content-Type: application/octet-stream\r\n"
           "\r\n" +
           payload +
           "\r\n------meshqBoundary42--\r\n";
}
}

TEST(MultipartTest, ParsesBoundary) {
    EXPECT_EQ(multipartBoundary(kType).value_or(""), "----meshqBoundary42");
    EXPECT_EQ(multipartBoundary("multipart/form-data; boundary=\"quoted b\"").value_or(""), "quoted b");
    EXPECT_EQ(multipartBoundary("Multipart/Form-Data; Boundary=abc; charset=utf-8").value_or(""), "abc");
}

TEST(MultipartTest, RejectsOtherContentTypes) {
    EXPECT_FALSE(multipartBoundary("application/octet-stream").has_value());
    EXPECT_FALSE(multipartBoundary("multipart/form-data").has_value());
    EXPECT_FALSE(multipartBoundary("multipart/form-data; boundary=").has_value());
}

TEST(MultipartTest, ExtractsNamedField) {
    auto file = extractMultipartField(kType, formBody("solid x\nendsolid x\n"), "file");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(*file, "solid x\nendsolid x\n");

    auto note = extractMultipartField(kType, formBody("ignored"), "note");
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ(*note, "hello");
}

TEST(MultipartTest, KeepsBinaryPayloadIntact) {
    std::string payload("\0\r\n--\x01\xff", 7);
    auto file = extractMultipartField(kType, formBody(payload), "file");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(*file, payload);
}

TEST(MultipartTest, FilenameIsNotMistakenForName) {
    std::string body =
        "------meshqBoundary42\r\n"
        "Content-Disposition: form-data; filename=\"file\"; name=\"other\"\r\n"
        "\r\n"
        "data\r\n"
        "------meshqBoundary42--\r\n";
    EXPECT_FALSE(extractMultipartField(kType, body, "file").has_value());
    EXPECT_EQ(extractMultipartField(kType, body, "other").value_or(""), "data");
}

TEST(MultipartTest, MissingOrTruncatedFieldYieldsNothing) {
    EXPECT_FALSE(extractMultipartField(kType, formBody("x"), "absent").has_value());

    std::string truncated = "------meshqBoundary42\r\n"
                            "Content-Disposition: form-data; name=\"file\"\r\n"
                            "\r\n"
                            "no closing delimiter";
    EXPECT_FALSE(extractMultipartField(kType, truncated, "file").has_value());
}
