#include <gtest/gtest.h>
#include "adapters/backend_adapter.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace llmbridge;

namespace {

ChatMessage Msg(const std::string& role, const std::string& content) {
    ChatMessage m;
    m.role = role;
    m.content = content;
    return m;
}

nlohmann::json Body(const HttpRequest& req) {
    return nlohmann::json::parse(req.body);
}

}  // namespace

class BackendAdapterTest : public ::testing::Test {
protected:
    std::unique_ptr<IBackendAdapter> openai = MakeBackendAdapter(BackendKind::kOpenAi);
    std::unique_ptr<IBackendAdapter> ollama = MakeBackendAdapter(BackendKind::kOllama);
    std::unique_ptr<IBackendAdapter> lollms = MakeBackendAdapter(BackendKind::kLollms);
};

TEST_F(BackendAdapterTest, KindsAndPaths) {
    EXPECT_EQ(openai->Kind(), BackendKind::kOpenAi);
    EXPECT_EQ(ollama->Kind(), BackendKind::kOllama);
    EXPECT_EQ(lollms->Kind(), BackendKind::kLollms);

    EXPECT_EQ(openai->ListModelsRequest().path, "/v1/models");
    EXPECT_EQ(openai->ListModelsRequest().method, "GET");
    EXPECT_EQ(ollama->ListModelsRequest().path, "/api/tags");
    EXPECT_EQ(lollms->ListModelsRequest().path, "/v1/models");

    EXPECT_EQ(openai->ChatRequest("m", {}, false).path, "/v1/chat/completions");
    EXPECT_EQ(ollama->ChatRequest("m", {}, false).path, "/api/chat");
    EXPECT_EQ(lollms->ChatRequest("m", {}, true).path, "/v1/chat/completions");
}

TEST_F(BackendAdapterTest, ChatBodyCarriesOnlyRoleAndContent) {
    auto m = Msg("user", "Hi");
    m.id = "msg-1";
    m.start_time = 1700000000;
    m.model = "other";
    auto req = openai->ChatRequest("llama3", {Msg("system", "Be brief"), m}, true);
    EXPECT_EQ(req.method, "POST");

    auto j = Body(req);
    EXPECT_EQ(j["model"], "llama3");
    EXPECT_EQ(j["stream"], true);
    ASSERT_EQ(j["messages"].size(), 2u);
    EXPECT_EQ(j["messages"][0], nlohmann::json({{"role", "system"}, {"content", "Be brief"}}));
    EXPECT_EQ(j["messages"][1], nlohmann::json({{"role", "user"}, {"content", "Hi"}}));
}

TEST_F(BackendAdapterTest, EmptyModelOmitted) {
    auto j = Body(ollama->ChatRequest("", {Msg("user", "Hi")}, false));
    EXPECT_FALSE(j.contains("model"));
    EXPECT_EQ(j["stream"], false);
}

TEST_F(BackendAdapterTest, PromptMessagesDropsSkippedKeepingOrder) {
    auto a = Msg("user", "a");
    auto b = Msg("assistant", "b");
    b.skip_in_prompt = true;
    auto c = Msg("user", "c");
    auto out = PromptMessages({a, b, c});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].content, "a");
    EXPECT_EQ(out[1].content, "c");
}

TEST_F(BackendAdapterTest, ContentPartsOpenAi) {
    ChatMessage m;
    m.role = "user";
    m.parts = {ContentPart::Text("what is this?"), ContentPart::ImageUrl("data:image/png;base64,QUJD")};
    auto j = Body(openai->ChatRequest("m", {m}, false));
    const auto& content = j["messages"][0]["content"];
    ASSERT_TRUE(content.is_array());
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "what is this?");
    EXPECT_EQ(content[1]["type"], "image_url");
    EXPECT_EQ(content[1]["image_url"]["url"], "data:image/png;base64,QUJD");
}

TEST_F(BackendAdapterTest, ContentPartsOllama) {
    ChatMessage m;
    m.role = "user";
    m.parts = {ContentPart::Text("one"), ContentPart::ImageUrl("data:image/png;base64,QUJD"), ContentPart::Text("two")};
    auto j = Body(ollama->ChatRequest("m", {m}, false));
    const auto& jm = j["messages"][0];
    EXPECT_EQ(jm["content"], "one\ntwo");
    ASSERT_TRUE(jm["images"].is_array());
    EXPECT_EQ(jm["images"][0], "QUJD");
}

TEST_F(BackendAdapterTest, DecodeModels) {
    std::string err;
    auto models = openai->DecodeModels(R"({"object":"list","data":[{"id":"a"},{"id":"b"},{"object":"model"}]})", &err);
    ASSERT_TRUE(models.has_value());
    ASSERT_EQ(models->size(), 2u);
    EXPECT_EQ((*models)[0].id, "a");
    EXPECT_EQ((*models)[1].id, "b");

    auto empty = openai->DecodeModels("{}", &err);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    EXPECT_FALSE(openai->DecodeModels("<html>", &err).has_value());
    EXPECT_FALSE(err.empty());

    auto tags = ollama->DecodeModels(R"({"models":[{"name":"llama3:8b"},{"model":"qwen2:7b"}]})", &err);
    ASSERT_TRUE(tags.has_value());
    ASSERT_EQ(tags->size(), 2u);
    EXPECT_EQ((*tags)[0].id, "llama3:8b");
    EXPECT_EQ((*tags)[1].id, "qwen2:7b");
}

TEST_F(BackendAdapterTest, DecodeChat) {
    std::string err;
    auto text = openai->DecodeChat(R"({"choices":[{"message":{"role":"assistant","content":"Hi!"}}]})", &err);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Hi!");

    auto none = openai->DecodeChat(R"({"choices":[]})", &err);
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(*none, "");

    auto native = ollama->DecodeChat(R"({"message":{"role":"assistant","content":"Hello"},"done":true})", &err);
    ASSERT_TRUE(native.has_value());
    EXPECT_EQ(*native, "Hello");

    EXPECT_FALSE(ollama->DecodeChat("not json", &err).has_value());
}

TEST_F(BackendAdapterTest, ExtendedEndpointRequests) {
    auto tok = TokenizeRequest("hello", "m1");
    EXPECT_EQ(tok.path, "/lollms/v1/tokenize");
    EXPECT_EQ(Body(tok), nlohmann::json({{"text", "hello"}, {"model", "m1"}}));
    EXPECT_FALSE(Body(TokenizeRequest("hello", "")).contains("model"));

    auto ctx = ContextSizeRequest("");
    EXPECT_EQ(ctx.path, "/lollms/v1/context_size");
    EXPECT_EQ(Body(ctx), nlohmann::json::object());

    auto ext = ExtractTextRequest("QUJD", "a.pdf");
    EXPECT_EQ(ext.path, "/v1/extract_text");
    EXPECT_EQ(Body(ext), nlohmann::json({{"file", "QUJD"}, {"filename", "a.pdf"}}));
}

TEST_F(BackendAdapterTest, ImageGenerationRequestDefaults) {
    ImageGenerationRequest r;
    r.prompt = "a cat";
    auto req = ImageGenerationHttpRequest(r);
    EXPECT_EQ(req.path, "/v1/images/generations");
    auto j = Body(req);
    EXPECT_EQ(j["prompt"], "a cat");
    EXPECT_EQ(j["n"], 1);
    EXPECT_EQ(j["response_format"], "b64_json");
    EXPECT_FALSE(j.contains("size"));

    r.size = "512x512";
    r.style = "vivid";
    j = Body(ImageGenerationHttpRequest(r));
    EXPECT_EQ(j["size"], "512x512");
    EXPECT_EQ(j["style"], "vivid");
}

TEST_F(BackendAdapterTest, DecodeExtendedResponses) {
    std::string err;
    auto tok = DecodeTokenize(R"({"tokens":[15,2,99]})", &err);
    ASSERT_TRUE(tok.has_value());
    EXPECT_EQ(tok->token_count, 3);
    EXPECT_EQ(tok->token_ids, (std::vector<int64_t>{15, 2, 99}));
    EXPECT_FALSE(tok->is_estimation);

    auto counted = DecodeTokenize(R"({"count":42})", &err);
    ASSERT_TRUE(counted.has_value());
    EXPECT_EQ(counted->token_count, 42);

    EXPECT_FALSE(DecodeTokenize(R"({"status":"ok"})", &err).has_value());

    auto ctx = DecodeContextSize(R"({"context_size":8192})", &err);
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->context_size, 8192);
    EXPECT_FALSE(DecodeContextSize(R"({"context_size":0})", &err).has_value());

    auto text = DecodeExtractText(R"({"text":"page one"})", &err);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "page one");

    auto img = DecodeImageGeneration(R"({"created":1,"data":[{"b64_json":"QUJD","revised_prompt":"a fluffy cat"}]})", &err);
    ASSERT_TRUE(img.has_value());
    EXPECT_EQ(img->created, 1);
    ASSERT_EQ(img->data.size(), 1u);
    EXPECT_EQ(img->data[0].b64_json.value_or(""), "QUJD");
    EXPECT_EQ(img->data[0].revised_prompt.value_or(""), "a fluffy cat");
    EXPECT_FALSE(img->data[0].url.has_value());
}

TEST_F(BackendAdapterTest, ExtractErrorDetail) {
    EXPECT_EQ(ExtractErrorDetail(R"({"error":{"message":"Invalid API key","type":"auth"}})"), "Invalid API key");
    EXPECT_EQ(ExtractErrorDetail(R"({"error":"model not found"})"), "model not found");
    EXPECT_EQ(ExtractErrorDetail(R"({"error":{"code":5}})"), R"({"code":5})");
    EXPECT_EQ(ExtractErrorDetail("  Bad Gateway\n"), "Bad Gateway");
    EXPECT_EQ(ExtractErrorDetail(""), "");
}
