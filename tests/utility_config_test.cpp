#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "ConfigManager.h"
#include "MultipartBuilder.h"
#include "PipelineConfig.h"
#include "PipelineConstants.h"
#include "PipelineError.h"
#include "Utility.h"
#include "TestSupport.h"

TEST(Utility, Base64MatchesRfc4648Vectors)
{
    EXPECT_EQ("", base64_encode(""));
    EXPECT_EQ("Zg==", base64_encode("f"));
    EXPECT_EQ("Zm8=", base64_encode("fo"));
    EXPECT_EQ("Zm9v", base64_encode("foo"));
    EXPECT_EQ("Zm9vYmFy", base64_encode("foobar"));
}

TEST(Utility, MetadataValueIsFlattenedAndTruncated)
{
    EXPECT_EQ("line one line two", sanitize_metadata_value("  line one\nline two\r\n", 500));

    std::string long_value(600, 'x');
    std::string cleaned = sanitize_metadata_value(long_value, 500);
    ASSERT_EQ(500u, cleaned.size());
    EXPECT_EQ("...", cleaned.substr(497));
}

TEST(Utility, MetadataKeyLosesSpacesAndCommas)
{
    EXPECT_EQ("my_key_x", sanitize_metadata_key("my key,x"));
    EXPECT_EQ("site.id-2", sanitize_metadata_key("site.id-2"));
}

TEST(Utility, SubmissionIdHasTimestampAndRandomSuffix)
{
    std::string a = generate_submission_id(1700000000123LL);
    std::string b = generate_submission_id(1700000000123LL);

    EXPECT_EQ(0u, a.find("sub-1700000000123-"));
    EXPECT_EQ(std::string("sub-1700000000123-").size() + 9, a.size());
    EXPECT_NE(a, b);
}

TEST(Utility, IntListParsing)
{
    std::vector<int64_t> values;
    ASSERT_TRUE(parse_int_list(" 0, 5000,10000 ", values));
    ASSERT_EQ(3u, values.size());
    EXPECT_EQ(10000, values[2]);

    std::vector<int64_t> untouched(1, 42);
    EXPECT_FALSE(parse_int_list("1,-2", untouched));
    EXPECT_FALSE(parse_int_list("1,,2", untouched));
    EXPECT_FALSE(parse_int_list("abc", untouched));
    ASSERT_EQ(1u, untouched.size());
    EXPECT_EQ(42, untouched[0]);
}

TEST(Utility, HeaderListParsing)
{
    FieldList headers = parse_header_list("X-Api-Key: abc; X-Site: 7;garbage; : empty");
    ASSERT_EQ(2u, headers.size());
    EXPECT_EQ("X-Api-Key", headers[0].first);
    EXPECT_EQ("abc", headers[0].second);
    EXPECT_EQ("X-Site", headers[1].first);
    EXPECT_EQ("7", headers[1].second);
}

TEST(Utility, MimeTypeFromExtension)
{
    EXPECT_EQ("audio/wav", guess_mime_type("clip.WAV"));
    EXPECT_EQ("audio/ogg", guess_mime_type("clip.opus"));
    EXPECT_EQ("audio/webm", guess_mime_type("clip"));
    EXPECT_EQ("clip.webm", base_name("/var/lib/clips/clip.webm"));
}

TEST(Utility, ReadFileBytes)
{
    TempDir dir;
    std::string path = dir.file("blob.bin");
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(read_file_bytes(path, bytes));
    ASSERT_EQ(3u, bytes.size());
    EXPECT_EQ('c', bytes[2]);
    EXPECT_FALSE(read_file_bytes(dir.file("missing.bin"), bytes));
}

TEST(MultipartBuilder, FieldsThenFileThenClosingBoundary)
{
    MultipartBuilder form("BOUNDARY");
    form.add_field("site", "7");
    std::vector<uint8_t> data = {'A', 'B'};
    form.add_file("audio_file", "clip \"1\".webm", "audio/webm", data);
    std::string body = form.finish();

    EXPECT_EQ("multipart/form-data; boundary=BOUNDARY", form.content_type());
    EXPECT_NE(std::string::npos, body.find("name=\"site\"\r\n\r\n7\r\n"));
    EXPECT_NE(std::string::npos, body.find("filename=\"clip %221%22.webm\""));
    EXPECT_NE(std::string::npos, body.find("Content-Type: audio/webm\r\n\r\nAB\r\n"));
    EXPECT_EQ("--BOUNDARY--\r\n", body.substr(body.size() - 14));

    // finish() is idempotent
    EXPECT_EQ(body, form.finish());
}

TEST(PipelineError, HttpStatusMapping)
{
    EXPECT_EQ(ERR_PAYLOAD_TOO_LARGE, PipelineError::from_http_status(413, "POST").kind);
    EXPECT_EQ(ERR_SERVER_4XX, PipelineError::from_http_status(400, "POST").kind);
    EXPECT_EQ(ERR_SERVER_5XX, PipelineError::from_http_status(503, "POST").kind);
    EXPECT_EQ(ERR_MALFORMED_RESPONSE, PipelineError::from_http_status(302, "POST").kind);
    EXPECT_EQ(503, PipelineError::from_http_status(503, "POST").http_status);
}

TEST(PipelineError, OnlyTransientErrorsAreRetryable)
{
    EXPECT_TRUE(PipelineError(ERR_NETWORK, "").is_retryable());
    EXPECT_TRUE(PipelineError(ERR_SERVER_5XX, "").is_retryable());
    EXPECT_FALSE(PipelineError(ERR_SERVER_4XX, "").is_retryable());
    EXPECT_FALSE(PipelineError(ERR_MALFORMED_RESPONSE, "").is_retryable());
    EXPECT_FALSE(PipelineError(ERR_STORAGE_QUOTA, "").is_retryable());
    EXPECT_FALSE(PipelineError(ERR_CIRCUIT_OPEN, "").is_retryable());
}

TEST(PipelineError, UserMessages)
{
    EXPECT_EQ("Saved offline, will retry automatically",
              describe_for_user(PipelineError(ERR_NETWORK, "")));
    EXPECT_EQ("Retries paused, the server is not responding. Next attempt in 120 s",
              describe_for_user(PipelineError(ERR_CIRCUIT_OPEN, ""), 119500));
    EXPECT_EQ("Device storage is full. Free some space and try again",
              describe_for_user(PipelineError(ERR_STORAGE_QUOTA, "")));
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ConfigManager::instance().clear(); }
    void TearDown() override { ConfigManager::instance().clear(); }

    std::string write_config(const std::string& text)
    {
        std::string path = dir.file("config.txt");
        std::ofstream out(path);
        out << text;
        return path;
    }

    TempDir dir;
};

TEST_F(ConfigTest, LoadsKeyValuesWithCommentsAndLastWins)
{
    std::string path = write_config(
        "# clip_uplink\n"
        "queue.max_retries = 3\n"
        "upload.direct_endpoint = https://api.example.org/submit#frag   # trailing\n"
        "queue.max_retries = 4\r\n"
        "not a key value line\n"
        "upload.resumable_enabled = off\n"
        "upload.chunked_endpoint = https://api.example.org/chunks\n");

    ConfigManager& cfg = ConfigManager::instance();
    ASSERT_TRUE(cfg.load(path));
    EXPECT_TRUE(cfg.is_loaded());
    EXPECT_EQ(4, cfg.get("queue.max_retries", 10));
    EXPECT_EQ("https://api.example.org/submit#frag", cfg.get_direct_endpoint());
    EXPECT_FALSE(cfg.is_resumable_enabled());
    EXPECT_EQ("https://api.example.org/chunks", cfg.get_chunked_endpoint());
    EXPECT_EQ(7, cfg.get("missing.key", 7));
}

TEST_F(ConfigTest, MissingFileFails)
{
    EXPECT_FALSE(ConfigManager::instance().load(dir.file("nope.txt")));
    EXPECT_FALSE(ConfigManager::instance().is_loaded());
}

TEST_F(ConfigTest, PipelineConfigDefaults)
{
    PipelineConfig c = PipelineConfig::from_config(ConfigManager::instance());
    EXPECT_EQ(PipelineDefaults::MAX_RETRIES, c.max_retries);
    EXPECT_EQ(40LL * 1024 * 1024, c.max_blob_size_bytes);
    EXPECT_TRUE(c.resumable_enabled);
    EXPECT_TRUE(c.resumable_endpoint.empty());
    EXPECT_TRUE(c.chunked_endpoint.empty());
    EXPECT_TRUE(c.retry_delays_ms.empty());
    EXPECT_EQ(2, c.live_attempts);
    EXPECT_EQ(5, c.breaker_threshold);
    EXPECT_EQ(300000, c.breaker_timeout_ms);
    EXPECT_DOUBLE_EQ(0.1, c.jitter_factor);
}

TEST_F(ConfigTest, PipelineConfigOverrides)
{
    ConfigManager& cfg = ConfigManager::instance();
    cfg.set("queue.max_retries", "6");
    cfg.set("upload.retry_delays", "0,1000,2000");
    cfg.set("upload.headers", "X-Api-Key: secret");
    cfg.set("upload.chunk_size", "65536");
    cfg.set("breaker.timeout_ms", "60000");

    PipelineConfig c = PipelineConfig::from_config(cfg);
    EXPECT_EQ(6, c.max_retries);
    ASSERT_EQ(3u, c.retry_delays_ms.size());
    EXPECT_EQ(2000, c.retry_delays_ms[2]);
    ASSERT_EQ(1u, c.headers.size());
    EXPECT_EQ("secret", c.headers[0].second);
    EXPECT_EQ(65536, c.chunk_size);
    EXPECT_EQ(60000, c.breaker_timeout_ms);
}

TEST_F(ConfigTest, InvalidRetryDelaysFallBackToTierTables)
{
    ConfigManager::instance().set("upload.retry_delays", "fast,faster");
    PipelineConfig c = PipelineConfig::from_config(ConfigManager::instance());
    EXPECT_TRUE(c.retry_delays_ms.empty());
}
