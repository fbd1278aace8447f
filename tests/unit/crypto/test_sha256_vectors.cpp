/**
 * @file test_sha256_vectors.cpp
 * @brief Fixture-driven SHA-256 / SHA-256d vectors and OpenSSL cross-checks
 *
 * Fixture format (tests/data/sha256_test_vectors.txt), one vector per line:
 *   :<id> <length> <input> <sha256-hex> <sha256d-hex>
 * where <input> is hex, '-' (empty), MILLION_a or RC4 (zero-key RC4
 * keystream of <length> bytes). sha256d = SHA-256(SHA-256(input)).
 *
 * Long inputs run only with --gtest_also_run_disabled_tests.
 *
 * @author shs Development Team
 * @copyright Copyright (c) 2024-2026 shs Development Team. All rights reserved.
 */

#include <gtest/gtest.h>
#include "shs/crypto/sha256.h"
#include "shs/utils/encoding.h"
#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <openssl/evp.h>

#ifndef SHS_TEST_DATA_DIR
#define SHS_TEST_DATA_DIR "tests/data"
#endif

namespace {

struct TestVector {
    std::string identifier;
    size_t input_length = 0;
    std::string input_data;
    shs::ByteVec sha256_hash;
    shs::ByteVec sha256d_hash;
};

std::vector<TestVector> load_vectors(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open fixture " + path);
    }

    std::vector<TestVector> vectors;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] != ':') {
            continue;
        }
        std::istringstream iss(line.substr(1));
        TestVector tv;
        std::string h1, h2;
        if (!(iss >> tv.identifier >> tv.input_length >> tv.input_data >> h1 >> h2)) {
            throw std::runtime_error("malformed fixture line: " + line);
        }
        tv.sha256_hash = shs::hexDecode(h1);
        tv.sha256d_hash = shs::hexDecode(h2);
        vectors.push_back(std::move(tv));
    }
    return vectors;
}

// Zero-key RC4 keystream
shs::ByteVec rc4_keystream(size_t length) {
    uint8_t s[256];
    for (int i = 0; i < 256; i++) {
        s[i] = static_cast<uint8_t>(i);
    }
    uint8_t j = 0;
    for (int i = 0; i < 256; i++) {
        j = static_cast<uint8_t>(j + s[i]);
        std::swap(s[i], s[j]);
    }

    shs::ByteVec out;
    out.reserve(length);
    uint8_t i = 0;
    j = 0;
    for (size_t n = 0; n < length; n++) {
        i = static_cast<uint8_t>(i + 1);
        j = static_cast<uint8_t>(j + s[i]);
        std::swap(s[i], s[j]);
        out.push_back(s[static_cast<uint8_t>(s[i] + s[j])]);
    }
    return out;
}

shs::ByteVec materialize(const TestVector& tv) {
    if (tv.input_data == "MILLION_a") {
        return shs::ByteVec(1000000, 'a');
    }
    if (tv.input_data == "RC4") {
        return rc4_keystream(tv.input_length);
    }
    if (tv.input_data == "-") {
        return {};
    }
    return shs::hexDecode(tv.input_data);
}

shs::ByteVec openssl_sha256(const shs::ByteVec& data) {
    shs::ByteVec digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    digest.resize(len);
    return digest;
}

shs::ByteVec to_vec(const shs::SHA256Digest& d) {
    return shs::ByteVec(d.begin(), d.end());
}

void check_vector(const TestVector& tv) {
    shs::ByteVec input = materialize(tv);
    ASSERT_EQ(input.size(), tv.input_length) << "input length mismatch for " << tv.identifier;

    shs::SHA256Digest h = shs::SHA256::hash(input);
    EXPECT_EQ(to_vec(h), tv.sha256_hash) << "SHA-256 mismatch for " << tv.identifier;

    shs::SHA256Digest hd = shs::SHA256::hash(h.data(), h.size());
    EXPECT_EQ(to_vec(hd), tv.sha256d_hash) << "SHA-256d mismatch for " << tv.identifier;
}

} // anonymous namespace

class SHA256VectorTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        vectors_ = load_vectors(std::string(SHS_TEST_DATA_DIR) + "/sha256_test_vectors.txt");
    }

    static std::vector<TestVector> vectors_;
};

std::vector<TestVector> SHA256VectorTest::vectors_;

// ============================================================================
// Fixture
// ============================================================================

TEST_F(SHA256VectorTest, FixtureIsWellFormed) {
    ASSERT_GE(vectors_.size(), 20u);
    for (const auto& tv : vectors_) {
        EXPECT_EQ(tv.sha256_hash.size(), 32u) << tv.identifier;
        EXPECT_EQ(tv.sha256d_hash.size(), 32u) << tv.identifier;
    }
}

TEST_F(SHA256VectorTest, ShortVectors) {
    size_t checked = 0;
    for (const auto& tv : vectors_) {
        if (tv.input_length > 65536) {
            continue;
        }
        check_vector(tv);
        checked++;
    }
    EXPECT_GT(checked, 0u);
}

TEST_F(SHA256VectorTest, DISABLED_AllVectors) {
    for (const auto& tv : vectors_) {
        check_vector(tv);
    }
}

TEST_F(SHA256VectorTest, DISABLED_MillionA) {
    shs::SHA256 ctx;
    shs::ByteVec block(1000, 'a');
    for (int i = 0; i < 1000; i++) {
        ctx.update(block);
    }
    EXPECT_EQ(shs::hexEncode(ctx.finalize()),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// RC4 generator
// ============================================================================

TEST(RC4KeystreamTest, ZeroKeyPrefix) {
    EXPECT_EQ(shs::hexEncode(rc4_keystream(8)), "de188941a3375d3a");
}

// ============================================================================
// OpenSSL cross-checks
// ============================================================================

TEST(SHA256OpenSSLTest, RandomLengthsAgree) {
    std::mt19937 rng(0x5eed);
    for (size_t len = 0; len < 300; len++) {
        shs::ByteVec data(len);
        for (auto& b : data) {
            b = static_cast<uint8_t>(rng());
        }
        EXPECT_EQ(to_vec(shs::SHA256::hash(data)), openssl_sha256(data)) << "length " << len;
    }
}

TEST(SHA256OpenSSLTest, OneMebibyteAgrees) {
    shs::ByteVec data(1024 * 1024);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<uint8_t>(i);
    }
    shs::SHA256Digest d = shs::SHA256::hash(data);
    EXPECT_EQ(shs::hexEncode(d),
              "fbbab289f7f94b25736c58be46a994c441fd02552cc6022352e3d86d2fab7c83");
    EXPECT_EQ(to_vec(d), openssl_sha256(data));
}

TEST(SHA256OpenSSLTest, DISABLED_ThreeMebibyteRC4Stream) {
    shs::ByteVec data = rc4_keystream(3 * 1024 * 1024);
    shs::ByteVec expected = openssl_sha256(data);

    EXPECT_EQ(to_vec(shs::SHA256::hash(data)), expected);

    // Same stream through the incremental API in odd-sized pieces
    shs::SHA256 ctx;
    const size_t chunk = 4099;
    for (size_t off = 0; off < data.size(); off += chunk) {
        ctx.update(data.data() + off, std::min(chunk, data.size() - off));
    }
    EXPECT_EQ(to_vec(ctx.finalize()), expected);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
