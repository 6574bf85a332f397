#include "mocks.hpp"
#include "../include/api.hpp"
#include "../include/errors.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;
using namespace std::chrono_literals;

namespace {

class AvatarApiTest : public ::testing::Test {
protected:
    AvatarApiTest()
        : orchestrator(provider, storage, PollerConfig{60s, 5s}, time.clock(), time.sleeper()),
          api("s3cret", orchestrator) {}

    static ApiRequest post(const json& body, const std::string& key = "s3cret") {
        ApiRequest req{"POST", "/generate-avatar", {}, body.dump()};
        if (!key.empty()) req.headers["x-api-key"] = key;
        return req;
    }

    static json body_of(const ApiReply& r) {
        return json::parse(r.body);
    }

    ::testing::StrictMock<MockProviderClient> provider;
    ::testing::StrictMock<MockStorageRelay> storage;
    FakeTime time;
    AvatarOrchestrator orchestrator;
    AvatarApi api;
};

TEST_F(AvatarApiTest, Health) {
    auto r = api.handle({"GET", "/health", {}, ""});
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(body_of(r)["status"], "ok");
}

TEST_F(AvatarApiTest, ModelsAndVoicesListCatalogs) {
    auto models = body_of(api.handle({"GET", "/models", {}, ""}));
    ASSERT_TRUE(models["avatars"].contains("lisa"));
    EXPECT_EQ(models["avatars"]["jeff"], json::array({"business", "formal"}));

    auto voices = body_of(api.handle({"GET", "/voices", {}, ""}));
    EXPECT_EQ(voices["voices"]["male"], json::array({"th-TH-NiwatNeural"}));
    EXPECT_EQ(voices["voices"]["female"].size(), 2u);
}

TEST_F(AvatarApiTest, UnknownRouteIs404) {
    EXPECT_EQ(api.handle({"GET", "/nope", {}, ""}).status, 404);
    EXPECT_EQ(api.handle({"GET", "/generate-avatar", {}, ""}).status, 404);
}

TEST_F(AvatarApiTest, PreflightIsAccepted) {
    EXPECT_EQ(api.handle({"OPTIONS", "/generate-avatar", {}, ""}).status, 204);
}

TEST_F(AvatarApiTest, MissingOrWrongKeyIs401) {
    EXPECT_CALL(provider, submit(_)).Times(0);
    auto r = api.handle(post({{"text", "hello"}}, ""));
    EXPECT_EQ(r.status, 401);
    EXPECT_EQ(body_of(r)["error"], "Invalid or missing API key");
    EXPECT_EQ(api.handle(post({{"text", "hello"}}, "wrong")).status, 401);
}

TEST_F(AvatarApiTest, KeyMayComeFromBody) {
    EXPECT_CALL(provider, submit(_)).WillOnce(Return("job-k"));
    EXPECT_CALL(provider, poll("job-k", _)).WillOnce(Return(succeeded("https://provider/k.mp4")));
    EXPECT_CALL(storage, upload(_)).WillOnce(Return("https://store/k.mp4"));

    auto r = api.handle(post({{"text", "hello"}, {"key", "s3cret"}}, ""));
    EXPECT_EQ(r.status, 200);
}

TEST_F(AvatarApiTest, MissingTextIs400) {
    EXPECT_CALL(provider, submit(_)).Times(0);
    auto r = api.handle(post({{"voice", "th-TH-NiwatNeural"}}));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(body_of(r)["error"], "Missing 'text' field");
    EXPECT_EQ(api.handle(post({{"text", "   "}})).status, 400);
}

TEST_F(AvatarApiTest, NonStringFieldIs400) {
    EXPECT_CALL(provider, submit(_)).Times(0);
    auto r = api.handle(post({{"text", "hello"}, {"voice", 7}}));
    EXPECT_EQ(r.status, 400);
    EXPECT_THAT(body_of(r)["error"].get<std::string>(), HasSubstr("voice"));
}

TEST_F(AvatarApiTest, CatalogViolationsAre400) {
    EXPECT_CALL(provider, submit(_)).Times(0);
    auto r = api.handle(post({{"text", "hello"}, {"voice", "en-US-JennyNeural"}}));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(body_of(r)["error"], "Invalid voice 'en-US-JennyNeural'. See GET /voices for options.");

    r = api.handle(post({{"text", "hello"}, {"talkingAvatarCharacter", "bob"}}));
    EXPECT_EQ(r.status, 400);

    r = api.handle(post({{"text", "hello"}, {"talkingAvatarCharacter", "jeff"}, {"talkingAvatarStyle", "casual"}}));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(body_of(r)["error"], "Invalid style 'casual' for character 'jeff'. Valid: ['business', 'formal']");
}

TEST_F(AvatarApiTest, SuccessReturnsVideoUrlAndJobId) {
    EXPECT_CALL(provider, submit(AllOf(Field(&SynthesisRequest::text, "สวัสดี"),
                                       Field(&SynthesisRequest::voice, "th-TH-PremwadeeNeural"),
                                       Field(&SynthesisRequest::avatar_character, "meg"),
                                       Field(&SynthesisRequest::avatar_style, "formal"))))
        .WillOnce(Return("job-ok"));
    EXPECT_CALL(provider, poll("job-ok", _)).WillOnce(Return(succeeded("https://provider/x.mp4")));
    EXPECT_CALL(storage, upload("https://provider/x.mp4")).WillOnce(Return("https://store/x.mp4"));

    auto r = api.handle(post({{"text", "  สวัสดี "},
                              {"voice", "th-TH-PremwadeeNeural"},
                              {"talkingAvatarCharacter", "meg"},
                              {"talkingAvatarStyle", "formal"}}));
    ASSERT_EQ(r.status, 200);
    auto body = body_of(r);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["video_url"], "https://store/x.mp4");
    EXPECT_EQ(body["job_id"], "job-ok");
}

TEST_F(AvatarApiTest, ProviderFailureIs502) {
    EXPECT_CALL(provider, submit(_)).WillOnce(Return("job-bad"));
    EXPECT_CALL(provider, poll("job-bad", _)).WillOnce(Return(failed("render crashed")));

    auto r = api.handle(post({{"text", "hello"}}));
    EXPECT_EQ(r.status, 502);
    EXPECT_EQ(body_of(r)["error"], "render crashed");
}

TEST_F(AvatarApiTest, SubmitRejectedIs502) {
    EXPECT_CALL(provider, submit(_)).WillOnce(Throw(ProviderRejected(400, "Azure job creation failed [400]: bad")));
    EXPECT_EQ(api.handle(post({{"text", "hello"}})).status, 502);
}

TEST_F(AvatarApiTest, TimeoutIs504) {
    EXPECT_CALL(provider, submit(_)).WillOnce(Return("job-t"));
    EXPECT_CALL(provider, poll("job-t", _)).Times(12).WillRepeatedly(Return(running()));

    auto r = api.handle(post({{"text", "hello"}}));
    EXPECT_EQ(r.status, 504);
    EXPECT_THAT(body_of(r)["error"].get<std::string>(), HasSubstr("did not finish within 60s"));
}

TEST_F(AvatarApiTest, UnexpectedErrorIs500) {
    EXPECT_CALL(provider, submit(_)).WillOnce(Throw(std::runtime_error("boom")));
    auto r = api.handle(post({{"text", "hello"}}));
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(body_of(r)["error"], "Unexpected error: boom");
}

} // namespace
