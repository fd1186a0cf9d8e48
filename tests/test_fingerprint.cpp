/**
 * MixGraph - Fingerprint Tests
 * Tests for Chroma, FeatureExtractor, FingerprintStore and content hashing
 */

#include "mixgraph/types.h"
#include "../src/core/utils.h"
#include "../src/core/log.h"
#include "../src/core/store.h"
#include "../src/core/content_hash.h"
#include "../src/decoder/decoder.h"
#include "../src/analyzer/stft.h"
#include "../src/analyzer/chroma.h"
#include "../src/analyzer/feature_extractor.h"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <cmath>
#include <cstring>

using namespace mixgraph;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(double actual, double expected, double tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

/* ============================================================================
 * Test Data Helpers
 * ============================================================================ */

constexpr int kRate = 22050;

std::vector<float> sine(double freq, double seconds, float amplitude = 0.5f) {
    std::vector<float> out(static_cast<size_t>(seconds * kRate));
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * freq * i / kRate));
    }
    return out;
}

// Tones that change pitch every half second
std::vector<float> melody(double seconds) {
    static const double notes[] = {261.63, 329.63, 392.00, 493.88, 440.00, 349.23, 293.66, 523.25};
    std::vector<float> out;
    int n = static_cast<int>(seconds * 2);
    for (int i = 0; i < n; ++i) {
        auto tone = sine(notes[i % 8], 0.5);
        out.insert(out.end(), tone.begin(), tone.end());
    }
    return out;
}

// 16-bit PCM mono WAV
void write_wav(const std::string& path, const std::vector<float>& samples, int sample_rate = kRate) {
    std::ofstream out(path, std::ios::binary);
    auto put32 = [&](uint32_t v) { out.write(reinterpret_cast<const char*>(&v), 4); };
    auto put16 = [&](uint16_t v) { out.write(reinterpret_cast<const char*>(&v), 2); };

    uint32_t data_bytes = static_cast<uint32_t>(samples.size() * 2);
    out.write("RIFF", 4);
    put32(36 + data_bytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put32(16);
    put16(1);                               // PCM
    put16(1);                               // mono
    put32(static_cast<uint32_t>(sample_rate));
    put32(static_cast<uint32_t>(sample_rate * 2));
    put16(2);
    put16(16);
    out.write("data", 4);
    put32(data_bytes);
    for (float s : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, s));
        put16(static_cast<uint16_t>(static_cast<int16_t>(clamped * 32767.0f)));
    }
}

std::string temp_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "mixgraph_test_fingerprint";
    std::filesystem::create_directories(dir);
    return (dir / name).string();
}

AudioBuffer make_buffer(std::vector<float> samples) {
    AudioBuffer buffer;
    buffer.samples = std::move(samples);
    buffer.sample_rate = kRate;
    buffer.channels = 1;
    return buffer;
}

/* ============================================================================
 * Chroma Tests
 * ============================================================================ */

TEST(stft_streams_frames_in_order) {
    // Bin 20 of a 2048-point transform at 22050 Hz
    const double freq = 20.0 * kRate / 2048.0;
    auto signal = sine(freq, 1.0);

    size_t expected = 0;
    size_t peak_bin = 0;
    const double* first_buffer = nullptr;
    bool reused = true;

    size_t frames = for_each_power_frame(signal, 2048, 512,
        [&](size_t t, const double* power, size_t bins) {
            if (t != expected || bins != 1025) {
                throw std::runtime_error("Frame out of order or wrong size");
            }
            ++expected;

            if (!first_buffer) first_buffer = power;
            reused = reused && power == first_buffer;

            if (t == 20) {
                for (size_t k = 1; k < bins; ++k) {
                    if (power[k] > power[peak_bin]) peak_bin = k;
                }
            }
        });

    assert_true(frames == stft_frame_count(signal.size(), 512), "Frame count returned");
    assert_true(frames == (signal.size() + 511) / 512, "ceil(samples / hop)");
    assert_true(expected == frames, "Every frame delivered");
    assert_true(reused, "One frame buffer for the whole signal");
    assert_true(peak_bin == 20, "Sine lands in its bin");
}

TEST(stft_empty_signal) {
    size_t calls = 0;
    size_t frames = for_each_power_frame({}, 2048, 512, [&](size_t, const double*, size_t) { ++calls; });
    assert_true(frames == 0 && calls == 0, "No frames");
}

TEST(chroma_frame_count) {
    FeatureExtractor extractor;
    for (size_t n : {size_t(1), size_t(511), size_t(512), size_t(513), size_t(kRate * 2 + 7)}) {
        auto result = extractor.compute_from_buffer(make_buffer(std::vector<float>(n, 0.1f)));
        assert_true(result.ok(), "compute_from_buffer failed");
        assert_true(result.value().frames() == (n + 511) / 512, "T must equal ceil(samples / hop)");
        assert_true(result.value().features.channels == 12, "12 pitch classes");
    }
}

TEST(chroma_pitch_class_of_a440) {
    ChromaExtractor chroma;
    auto m = chroma.compute(sine(440.0, 2.0));

    std::vector<double> totals(12, 0.0);
    for (int c = 0; c < 12; ++c) {
        for (size_t t = 0; t < m.frames; ++t) totals[c] += m.at(c, t);
    }
    int best = static_cast<int>(std::max_element(totals.begin(), totals.end()) - totals.begin());
    assert_true(best == 9, "A440 should fall in pitch class A (index 9)");
}

TEST(chroma_frames_max_normalized) {
    ChromaExtractor chroma;
    auto m = chroma.compute(melody(3.0));
    for (size_t t = 0; t < m.frames; ++t) {
        float peak = 0.0f;
        for (int c = 0; c < 12; ++c) peak = std::max(peak, m.at(c, t));
        assert_near(peak, 1.0, 1e-5, "Non-silent frame peak");
    }
}

TEST(chroma_silence_is_zero) {
    ChromaExtractor chroma;
    auto m = chroma.compute(std::vector<float>(kRate, 0.0f));
    for (float v : m.data) {
        assert_true(v == 0.0f, "Silent input gives zero chroma");
    }
}

TEST(chroma_wrong_sample_rate_rejected) {
    FeatureExtractor extractor;
    AudioBuffer buffer = make_buffer(std::vector<float>(4096, 0.1f));
    buffer.sample_rate = 44100;
    auto result = extractor.compute_from_buffer(buffer);
    assert_true(result.failed(), "Mismatched rate should fail");
    assert_true(result.code() == ErrorCode::InvalidArgument, "InvalidArgument");
}

/* ============================================================================
 * Content Hash Tests
 * ============================================================================ */

TEST(hash_string_sha256) {
    assert_true(hash_string("abc") ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "SHA-256 of 'abc'");
}

TEST(hash_file_matches_contents) {
    std::string a = temp_path("hash_a.bin");
    std::string b = temp_path("hash_b.bin");
    { std::ofstream(a, std::ios::binary) << "abc"; }
    { std::ofstream(b, std::ios::binary) << "abd"; }

    auto ha = hash_file(a);
    auto hb = hash_file(b);
    assert_true(ha.ok() && hb.ok(), "hash_file failed");
    assert_true(ha.value() == hash_string("abc"), "File hash equals string hash");
    assert_true(ha.value() != hb.value(), "Different contents, different hash");

    auto missing = hash_file(temp_path("does_not_exist.bin"));
    assert_true(missing.code() == ErrorCode::MissingInput, "Missing file");
}

/* ============================================================================
 * FingerprintStore Tests
 * ============================================================================ */

TEST(store_upsert_and_get) {
    FingerprintStore store(":memory:");
    assert_true(store.is_open(), "Store should open");

    Fingerprint fp;
    fp.features = FeatureMatrix(12, 3);
    for (size_t i = 0; i < fp.features.data.size(); ++i) fp.features.data[i] = 0.25f * i;
    fp.source_path = "/music/song.flac";
    fp.cache_key = "key-1";

    assert_true(store.upsert_fingerprint(fp).ok(), "Upsert");
    assert_true(store.contains("key-1"), "Contains");
    assert_true(store.get_fingerprint_count() == 1, "Count 1");

    auto loaded = store.get_fingerprint("key-1");
    assert_true(loaded.has_value(), "Loaded");
    assert_true(loaded->features.data == fp.features.data, "Features round-trip");
    assert_true(loaded->features.channels == 12 && loaded->features.frames == 3, "Shape");
    assert_true(loaded->source_path == fp.source_path, "Source path");

    // Upsert replaces
    fp.features.data[0] = 42.0f;
    assert_true(store.upsert_fingerprint(fp).ok(), "Second upsert");
    assert_true(store.get_fingerprint_count() == 1, "Still one entry");
    assert_true(store.get_fingerprint("key-1")->features.data[0] == 42.0f, "Replaced");

    assert_true(store.delete_fingerprint("key-1"), "Delete");
    assert_true(!store.get_fingerprint("key-1").has_value(), "Gone");
}

TEST(store_rejects_empty_key) {
    FingerprintStore store(":memory:");
    Fingerprint fp;
    fp.features = FeatureMatrix(12, 1);
    auto result = store.upsert_fingerprint(fp);
    assert_true(result.failed(), "Empty key rejected");
    assert_true(result.code() == ErrorCode::InvalidArgument, "InvalidArgument");
}

TEST(store_cleanup_missing_files) {
    FingerprintStore store(":memory:");
    std::string present = temp_path("present.wav");
    write_wav(present, std::vector<float>(100, 0.0f));

    Fingerprint a;
    a.features = FeatureMatrix(12, 1);
    a.source_path = present;
    a.cache_key = "present";
    Fingerprint b = a;
    b.source_path = temp_path("vanished.wav");
    b.cache_key = "vanished";

    store.upsert_fingerprint(a);
    store.upsert_fingerprint(b);
    assert_true(store.cleanup_missing_files() == 1, "One stale entry removed");
    assert_true(store.contains("present") && !store.contains("vanished"), "Right entry removed");
}

/* ============================================================================
 * FeatureExtractor Tests
 * ============================================================================ */

TEST(extractor_cache_round_trip) {
    std::string path = temp_path("melody.wav");
    write_wav(path, melody(4.0));

    FingerprintStore store(":memory:");
    FeatureExtractor extractor(FingerprintConfig(), &store);

    auto first = extractor.compute_fingerprint(path);
    assert_true(first.ok(), "First fingerprint");
    assert_true(store.get_fingerprint_count() == 1, "Cache written");

    auto second = extractor.compute_fingerprint(path);
    assert_true(second.ok(), "Second fingerprint");
    assert_true(store.get_fingerprint_count() == 1, "No duplicate entry");

    const auto& a = first.value().features;
    const auto& b = second.value().features;
    assert_true(a.channels == b.channels && a.frames == b.frames, "Same shape");
    assert_true(std::memcmp(a.data.data(), b.data.data(), a.data.size() * sizeof(float)) == 0,
        "Cache hit must be bit-identical");
    assert_true(first.value().cache_key == second.value().cache_key, "Same key");
}

TEST(extractor_frame_invariant_on_file) {
    std::string path = temp_path("invariant.wav");
    write_wav(path, melody(3.0));

    Decoder decoder;
    auto decoded = decoder.decode_for_analysis(path, kRate);
    assert_true(decoded.ok(), "Decode");

    FeatureExtractor extractor;
    auto fp = extractor.compute_fingerprint(path);
    assert_true(fp.ok(), "Fingerprint");
    size_t n = decoded.value().samples.size();
    assert_true(fp.value().frames() == (n + 511) / 512, "T = ceil(samples / hop)");
    assert_true(fp.value().source_path == path, "Source path recorded");
}

TEST(extractor_cache_key_depends_on_parameters) {
    FingerprintConfig a;
    FingerprintConfig b;
    b.hop_length = 1024;
    FeatureExtractor ea(a);
    FeatureExtractor eb(b);
    assert_true(ea.cache_key_for("abc") != eb.cache_key_for("abc"), "Hop length is part of the key");
    assert_true(ea.cache_key_for("abc") != ea.cache_key_for("abd"), "Content hash is part of the key");
}

TEST(extractor_missing_file) {
    FingerprintStore store(":memory:");
    FeatureExtractor extractor(FingerprintConfig(), &store);
    auto result = extractor.compute_fingerprint(temp_path("no_such_song.mp3"));
    assert_true(result.failed(), "Missing file fails");
    assert_true(result.code() == ErrorCode::MissingInput, "MissingInput");
}

TEST(extractor_unreadable_file) {
    std::string path = temp_path("garbage.wav");
    {
        std::ofstream out(path);
        for (int i = 0; i < 200; ++i) out << "this is not audio data\n";
    }

    FingerprintStore store(":memory:");
    FeatureExtractor extractor(FingerprintConfig(), &store);
    auto result = extractor.compute_fingerprint(path);
    assert_true(result.failed(), "Garbage fails");
    assert_true(result.code() == ErrorCode::DecodeError, "DecodeError");
    assert_true(store.get_fingerprint_count() == 0, "Nothing cached");
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    log::set_level(log::Level::Error);

    std::cout << "======================================\n";
    std::cout << "MixGraph - Fingerprint Tests\n";
    std::cout << "======================================\n\n";

    std::cout << "--- STFT ---\n";
    RUN_TEST(stft_streams_frames_in_order);
    RUN_TEST(stft_empty_signal);

    std::cout << "\n--- ChromaExtractor ---\n";
    RUN_TEST(chroma_frame_count);
    RUN_TEST(chroma_pitch_class_of_a440);
    RUN_TEST(chroma_frames_max_normalized);
    RUN_TEST(chroma_silence_is_zero);
    RUN_TEST(chroma_wrong_sample_rate_rejected);

    std::cout << "\n--- Content Hash ---\n";
    RUN_TEST(hash_string_sha256);
    RUN_TEST(hash_file_matches_contents);

    std::cout << "\n--- FingerprintStore ---\n";
    RUN_TEST(store_upsert_and_get);
    RUN_TEST(store_rejects_empty_key);
    RUN_TEST(store_cleanup_missing_files);

    std::cout << "\n--- FeatureExtractor ---\n";
    RUN_TEST(extractor_cache_round_trip);
    RUN_TEST(extractor_frame_invariant_on_file);
    RUN_TEST(extractor_cache_key_depends_on_parameters);
    RUN_TEST(extractor_missing_file);
    RUN_TEST(extractor_unreadable_file);

    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests PASSED!\n";
    } else {
        std::cout << failed_tests << " test(s) FAILED\n";
    }
    std::cout << "======================================\n";

    return failed_tests > 0 ? 1 : 0;
}
