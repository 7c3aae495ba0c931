#include <gtest/gtest.h>

#include <chrono>
#include <boost/asio/io_context.hpp>
#include "core/stream/reliable_stream.hpp"
#include "fake_http_client.hpp"

using namespace std::chrono_literals;
using rfetch::core::Completion;
using rfetch::core::ReliableStream;
using rfetch::core::StreamOptions;
using rfetch::core::StreamState;
using rfetch::infra::ErrorCode;
using rfetch::test_support::ScriptedClient;
using rfetch::test_support::ScriptedResponse;
using rfetch::test_support::make_scenario;
using rfetch::test_support::script_scenario;
namespace http = rfetch::adapters::http;

namespace {

struct Outcome {
    std::vector<std::uint8_t> data;
    std::vector<std::size_t> chunk_sizes;
    std::optional<Completion> completion;
    std::optional<rfetch::infra::Error> error;
    int ends = 0;
    int errors = 0;
};

// Потребитель без автоматического спроса
class PullConsumer final : public rfetch::core::StreamConsumer {
public:
    explicit PullConsumer(Outcome& outcome) : outcome_(outcome) {}

    void on_data(const rfetch::core::Chunk& chunk) override {
        outcome_.data.insert(outcome_.data.end(), chunk.begin(), chunk.end());
        outcome_.chunk_sizes.push_back(chunk.size());
    }
    void on_end(const Completion& completion) override {
        ++outcome_.ends;
        outcome_.completion = completion;
    }
    void on_error(const rfetch::infra::Error& error) override {
        ++outcome_.errors;
        outcome_.error = error;
    }

private:
    Outcome& outcome_;
};

auto fast_retry(int max_attempts = 3) -> rfetch::infra::RetryPolicy {
    return rfetch::infra::RetryPolicy{
        .max_attempts = max_attempts,
        .min_delay = 1ms,
        .max_delay = 4ms,
        .factor = 2.0,
        .randomize = false,
    };
}

} // namespace

class ReliableStreamTest : public ::testing::Test {
protected:
    auto options(std::size_t hwm = 64 * 1024) -> StreamOptions {
        return StreamOptions{
            .path = "/resource",
            .client = client,
            .high_water_mark = hwm,
            .retry_policy = fast_retry(),
            .logger = nullptr,
        };
    }

    auto open(StreamOptions opts) -> std::shared_ptr<ReliableStream> {
        auto stream = rfetch::core::open_stream(io, std::move(opts), handlers());
        EXPECT_TRUE(stream.has_value());
        return stream ? *stream : nullptr;
    }

    auto handlers() -> rfetch::core::CallbackConsumer::Handlers {
        return rfetch::core::CallbackConsumer::Handlers{
            .on_data = [this](const rfetch::core::Chunk& chunk) {
                outcome.data.insert(outcome.data.end(), chunk.begin(), chunk.end());
                outcome.chunk_sizes.push_back(chunk.size());
                if (on_data_hook) on_data_hook();
            },
            .on_end = [this](const Completion& completion) {
                ++outcome.ends;
                outcome.completion = completion;
            },
            .on_error = [this](const rfetch::infra::Error& error) {
                ++outcome.errors;
                outcome.error = error;
            },
        };
    }

    auto run_scenario(const std::string& name,
                      const std::vector<std::string>& steps,
                      std::size_t hwm = 64 * 1024) -> std::shared_ptr<ReliableStream>
    {
        script_scenario(*client, make_scenario(name, steps));
        auto stream = open(options(hwm));
        io.run();
        return stream;
    }

    boost::asio::io_context io;
    std::shared_ptr<ScriptedClient> client = std::make_shared<ScriptedClient>(io);
    Outcome outcome;
    std::function<void()> on_data_hook;
};

TEST_F(ReliableStreamTest, ZeroByteResource) {
    auto stream = run_scenario("zero", {"0"});

    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_TRUE(outcome.data.empty());
    ASSERT_TRUE(outcome.completion);
    EXPECT_EQ(outcome.completion->bytes, 0u);
    EXPECT_EQ(outcome.completion->md5_base64, "1B2M2Y8AsgTpgAmY7PhCfg==");

    ASSERT_EQ(client->requests.size(), 1u);
    EXPECT_EQ(client->requests[0].path, "/resource");
    EXPECT_FALSE(client->requests[0].range_start);
    EXPECT_EQ(stream->state(), StreamState::Completed);
}

TEST_F(ReliableStreamTest, SmallResourceMatchesPayload) {
    auto stream = run_scenario("small", {"137"});

    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.data, http::scenario_payload(137));
    EXPECT_EQ(outcome.completion->bytes, 137u);
    EXPECT_EQ(stream->bytes_consumed(), 137u);
    EXPECT_EQ(stream->resumes(), 0u);
    EXPECT_EQ(stream->retries(), 0u);
}

TEST_F(ReliableStreamTest, MissingContentMd5SkipsVerification) {
    auto scenario = make_scenario("no-md5", {"5120"});
    scenario.md5_mode = http::Md5Mode::Omit;
    script_scenario(*client, scenario);
    auto stream = open(options());
    io.run();

    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.data.size(), 5120u);
    ASSERT_TRUE(stream->expected());
    EXPECT_FALSE(stream->expected()->md5);
    EXPECT_EQ(stream->expected()->length, 5120u);
}

TEST_F(ReliableStreamTest, ChunksNeverExceedHighWaterMark) {
    constexpr std::size_t hwm = 10000;
    constexpr std::size_t total = 8 * 1024 * 1024;
    auto stream = run_scenario("large", {std::to_string(total)}, hwm);

    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.data.size(), total);
    EXPECT_EQ(outcome.data, http::scenario_payload(total));
    for (auto size : outcome.chunk_sizes) {
        ASSERT_LE(size, hwm);
        ASSERT_GT(size, 0u);
    }
}

TEST_F(ReliableStreamTest, PrematureClosesResumeFromDeliveredOffset) {
    const std::vector<std::uint64_t> steps{137, 1024, 1024 * 1024, 47, 0, 36, 0, 10};
    std::vector<std::string> text;
    std::uint64_t total = 0;
    for (auto s : steps) {
        text.push_back(std::to_string(s));
        total += s;
    }

    auto stream = run_scenario("interrupted", text);

    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.data, http::scenario_payload(total));
    EXPECT_EQ(stream->resumes(), steps.size() - 1);
    EXPECT_EQ(stream->retries(), 0u);

    ASSERT_EQ(client->requests.size(), steps.size());
    EXPECT_FALSE(client->requests[0].range_start);
    std::uint64_t offset = 0;
    for (std::size_t i = 1; i < steps.size(); ++i) {
        offset += steps[i - 1];
        ASSERT_TRUE(client->requests[i].range_start) << "request " << i;
        EXPECT_EQ(*client->requests[i].range_start, offset) << "request " << i;
    }
}

TEST_F(ReliableStreamTest, Md5MismatchFails) {
    auto scenario = make_scenario("bad_md5", {"5120"});
    scenario.md5_mode = http::Md5Mode::Override;
    scenario.md5_override = "deadbeef";
    script_scenario(*client, scenario);
    auto stream = open(options());
    io.run();

    EXPECT_EQ(outcome.ends, 0);
    ASSERT_EQ(outcome.errors, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::ChecksumMismatch);
    EXPECT_EQ(outcome.error->message.rfind("md5 mismatch: expected \"deadbeef\", got \"", 0), 0u)
        << outcome.error->message;
    EXPECT_EQ(outcome.data.size(), 5120u);
    EXPECT_EQ(stream->state(), StreamState::Failed);
}

TEST_F(ReliableStreamTest, ChangedEtagFails) {
    auto stream = run_scenario("changed_etag", {"10240", "change_etag", "1024"});

    EXPECT_EQ(outcome.ends, 0);
    ASSERT_EQ(outcome.errors, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::IdentityMismatch);
    EXPECT_EQ(outcome.error->message, "object changed while fetching (etag mismatch)");
    EXPECT_EQ(outcome.data.size(), 10240u);
    ASSERT_EQ(client->requests.size(), 2u);
    EXPECT_EQ(client->requests[1].range_start, 10240u);
}

TEST_F(ReliableStreamTest, TransientServerErrorsAreRetried) {
    auto stream = run_scenario("transient_500", {
        "128", "error_500", "256", "error_503", "128", "error_500", "1024", "error_503", "57"
    });

    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.data, http::scenario_payload(128 + 256 + 128 + 1024 + 57));
    EXPECT_EQ(stream->retries(), 4u);
    EXPECT_EQ(stream->resumes(), 4u);
}

TEST_F(ReliableStreamTest, PersistentServerErrorsExhaustRetries) {
    auto stream = run_scenario("persistent_500", {
        "128", "error_500", "error_503", "error_503", "error_503", "517"
    });

    EXPECT_EQ(outcome.ends, 0);
    ASSERT_EQ(outcome.errors, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::ServerError);
    EXPECT_EQ(outcome.error->status_code, 503);
    EXPECT_EQ(outcome.error->message, "request failed with status 503 (Scripted)");
    EXPECT_EQ(stream->retries(), 3u);
    EXPECT_EQ(client->requests.size(), 5u);
    EXPECT_EQ(outcome.data.size(), 128u);
}

TEST_F(ReliableStreamTest, ClientErrorIsNotRetried) {
    auto stream = run_scenario("error_400", {"error_400", "128"});

    EXPECT_EQ(outcome.ends, 0);
    ASSERT_EQ(outcome.errors, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::ClientError);
    EXPECT_EQ(outcome.error->status_code, 400);
    EXPECT_EQ(client->requests.size(), 1u);
    EXPECT_EQ(stream->retries(), 0u);
}

TEST_F(ReliableStreamTest, ZeroRetryBudgetFailsOnFirstTransientError) {
    script_scenario(*client, make_scenario("no_retries", {"error_503", "10"}));
    auto opts = options();
    opts.retry_policy = fast_retry(0);
    auto stream = open(std::move(opts));
    io.run();

    ASSERT_EQ(outcome.errors, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::ServerError);
    EXPECT_EQ(client->requests.size(), 1u);
    EXPECT_EQ(stream->retries(), 0u);
}

TEST_F(ReliableStreamTest, NetworkFailureBeforeHeadersIsRetried) {
    client->push(ScriptedResponse{.network_error = "connection refused"});
    script_scenario(*client, make_scenario("small", {"137"}));
    auto stream = open(options());
    io.run();

    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.data, http::scenario_payload(137));
    EXPECT_EQ(stream->retries(), 1u);
    ASSERT_EQ(client->requests.size(), 2u);
    EXPECT_FALSE(client->requests[1].range_start);
}

TEST_F(ReliableStreamTest, BodyErrorRetriesFromDeliveredOffset) {
    const auto raw = http::scenario_payload(1000);
    const auto md5 = rfetch::infra::IntegrityTracker::md5_base64(raw).value();

    ScriptedResponse first;
    first.meta.content_length = 1000;
    first.meta.etag = "etag0";
    first.meta.content_md5 = md5;
    first.pieces = rfetch::test_support::split(raw, 0, 400);
    first.body_error = "connection reset by peer";
    client->push(std::move(first));

    ScriptedResponse second;
    second.status = 206;
    second.meta.content_length = 600;
    second.meta.etag = "etag0";
    second.pieces = rfetch::test_support::split(raw, 400, 600);
    client->push(std::move(second));

    auto stream = open(options());
    io.run();

    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.data, raw);
    EXPECT_EQ(stream->retries(), 1u);
    ASSERT_EQ(client->requests.size(), 2u);
    EXPECT_EQ(client->requests[1].range_start, 400u);
}

TEST_F(ReliableStreamTest, AbortOnCreateIsSilent) {
    script_scenario(*client, make_scenario("small", {"137"}));
    auto stream = open(options());
    stream->abort();
    stream->abort();
    stream->request_more();
    io.run();

    EXPECT_EQ(outcome.ends, 0);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_TRUE(outcome.data.empty());
    EXPECT_TRUE(client->requests.empty());
    EXPECT_EQ(stream->state(), StreamState::Aborted);
}

TEST_F(ReliableStreamTest, AbortFromDataCallbackStopsDelivery) {
    script_scenario(*client, make_scenario("small", {"5120"}));
    auto stream = open(options(100));
    on_data_hook = [&]() { stream->abort(); };
    io.run();

    EXPECT_EQ(outcome.chunk_sizes.size(), 1u);
    EXPECT_EQ(outcome.ends, 0);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(stream->state(), StreamState::Aborted);
    ASSERT_EQ(client->bodies.size(), 1u);
    EXPECT_TRUE(client->bodies[0]->destroyed());
}

TEST_F(ReliableStreamTest, AbortDuringBackoffCancelsTimer) {
    client->push(ScriptedResponse{.network_error = "connection refused"});
    auto opts = options();
    opts.retry_policy = rfetch::infra::RetryPolicy{.min_delay = 10s, .max_delay = 10s};
    auto stream = open(std::move(opts));

    while (stream->state() != StreamState::BackingOff && io.run_one() > 0) {
    }
    ASSERT_EQ(stream->state(), StreamState::BackingOff);

    const auto started = std::chrono::steady_clock::now();
    stream->abort();
    io.run();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(client->requests.size(), 1u);
    EXPECT_EQ(stream->state(), StreamState::Aborted);
}

TEST_F(ReliableStreamTest, PullConsumerGetsOneChunkPerDemand) {
    script_scenario(*client, make_scenario("small", {"1000"}));
    auto consumer = std::make_shared<PullConsumer>(outcome);
    auto created = ReliableStream::create(io, options(100), consumer);
    ASSERT_TRUE(created);
    auto stream = *created;

    stream->request_more();
    stream->request_more();   // уже ждём данных: игнорируется
    io.run();
    EXPECT_EQ(outcome.chunk_sizes.size(), 1u);
    EXPECT_EQ(client->requests.size(), 1u);

    for (int i = 0; i < 20 && outcome.ends == 0; ++i) {
        stream->request_more();
        io.restart();
        io.run();
    }

    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.data, http::scenario_payload(1000));
    EXPECT_EQ(outcome.chunk_sizes.size(), 10u);
    EXPECT_EQ(client->requests.size(), 1u);
}

TEST_F(ReliableStreamTest, CreateRejectsInvalidOptions) {
    auto consumer = std::make_shared<PullConsumer>(outcome);

    auto no_path = options();
    no_path.path.clear();
    auto r1 = ReliableStream::create(io, no_path, consumer);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code, ErrorCode::InvalidArgument);

    auto no_client = options();
    no_client.client = nullptr;
    EXPECT_FALSE(ReliableStream::create(io, no_client, consumer));

    EXPECT_FALSE(ReliableStream::create(io, options(0), consumer));
    EXPECT_FALSE(ReliableStream::create(io, options(), nullptr));

    auto bad_retry = options();
    bad_retry.retry_policy = rfetch::infra::RetryPolicy{.min_delay = 5s, .max_delay = 1s};
    auto r2 = ReliableStream::create(io, bad_retry, consumer);
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ReliableStreamTest, RangeRequestAnsweredWithFullBodyFails) {
    const auto raw = http::scenario_payload(1000);

    ScriptedResponse first;
    first.meta.content_length = 1000;
    first.meta.etag = "etag0";
    first.pieces = rfetch::test_support::split(raw, 0, 400);
    client->push(std::move(first));

    // Range проигнорирован: 200 и всё тело с начала
    ScriptedResponse second;
    second.meta.content_length = 1000;
    second.meta.etag = "etag0";
    second.pieces = rfetch::test_support::split(raw, 0, 1000);
    client->push(std::move(second));

    auto stream = open(options());
    io.run();

    EXPECT_EQ(outcome.ends, 0);
    ASSERT_EQ(outcome.errors, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::UnexpectedStatus);
    EXPECT_EQ(outcome.data.size(), 400u);
    EXPECT_EQ(stream->bytes_consumed(), 400u);
    ASSERT_EQ(client->requests.size(), 2u);
    EXPECT_EQ(client->requests[1].range_start, 400u);
    ASSERT_EQ(client->bodies.size(), 2u);
    EXPECT_TRUE(client->bodies[1]->destroyed());
}

TEST_F(ReliableStreamTest, AbortAfterCompletionIsNoop) {
    auto stream = run_scenario("small", {"137"});
    ASSERT_EQ(stream->state(), StreamState::Completed);

    stream->abort();
    stream->request_more();
    io.restart();
    io.run();

    EXPECT_EQ(stream->state(), StreamState::Completed);
    EXPECT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_EQ(client->requests.size(), 1u);
}

TEST_F(ReliableStreamTest, AbortWhileRequestInFlightCancelsIt) {
    script_scenario(*client, make_scenario("small", {"137"}));
    auto stream = open(options());

    while (client->requests.empty() && io.run_one() > 0) {
    }
    ASSERT_EQ(stream->state(), StreamState::AwaitingResponse);
    ASSERT_EQ(client->handles.size(), 1u);

    stream->abort();
    io.run();

    EXPECT_TRUE(client->handles[0]->cancelled);
    ASSERT_EQ(client->bodies.size(), 1u);
    EXPECT_TRUE(client->bodies[0]->destroyed());
    EXPECT_EQ(stream->state(), StreamState::Aborted);
    EXPECT_EQ(outcome.ends, 0);
    EXPECT_EQ(outcome.errors, 0);
    EXPECT_TRUE(outcome.data.empty());
    EXPECT_EQ(client->requests.size(), 1u);
}

TEST_F(ReliableStreamTest, MissingContentLengthCompletesOnEnd) {
    const auto raw = http::scenario_payload(500);

    ScriptedResponse response;
    response.meta.etag = "etag0";
    response.meta.content_md5 = rfetch::infra::IntegrityTracker::md5_base64(raw).value();
    response.pieces = rfetch::test_support::split(raw, 0, 500, 128);
    client->push(std::move(response));

    auto stream = open(options());
    io.run();

    EXPECT_EQ(outcome.errors, 0);
    ASSERT_EQ(outcome.ends, 1);
    EXPECT_EQ(outcome.data, raw);
    EXPECT_EQ(outcome.completion->bytes, 500u);
    EXPECT_EQ(stream->resumes(), 0u);
    EXPECT_EQ(client->requests.size(), 1u);
}
