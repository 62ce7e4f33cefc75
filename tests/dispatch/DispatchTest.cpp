#include "reqkit/dispatch/ResponseDispatcher.hpp"
#include "reqkit/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reqkit;

namespace demo {

struct Todo {
    int id = 0;
    std::string title;
    bool done = false;
};

bool fromJson(const rapidjson::Value& v, Todo& out) {
    if (!v.IsObject()) return false;
    auto id = v.FindMember("id");
    auto title = v.FindMember("title");
    auto done = v.FindMember("done");
    if (id == v.MemberEnd() || title == v.MemberEnd() || done == v.MemberEnd()) return false;
    return reqkit::fromJson(id->value, out.id) &&
           reqkit::fromJson(title->value, out.title) &&
           reqkit::fromJson(done->value, out.done);
}

} // namespace demo

namespace {

Result<Response> ok(std::string body, int status = 200) {
    Response r;
    r.status = status;
    r.headers = {{"Content-Type", "application/json"}};
    r.body = std::move(body);
    return r;
}

// Records which consumers fired, in order.
template <typename T>
struct Recorder {
    std::vector<std::string> calls;
    std::vector<Error> errors;
    std::string data, text;
    T object{};
    int status = 0;

    CallbackSet<T> all() {
        CallbackSet<T> cbs;
        cbs.onData       = [this](const std::string& b){ calls.push_back("data"); data = b; };
        cbs.onString     = [this](const std::string& s){ calls.push_back("string"); text = s; };
        cbs.onJson       = [this](const rapidjson::Document&){ calls.push_back("json"); };
        cbs.onObject     = [this](const T& o){ calls.push_back("object"); object = o; };
        cbs.onStatusCode = [this](int s){ calls.push_back("status"); status = s; };
        cbs.onError      = [this](const Error& e){ calls.push_back("error"); errors.push_back(e); };
        return cbs;
    }
};

} // namespace

TEST(DispatchTest, EveryConsumerFiresInOrder) {
    Recorder<demo::Todo> rec;
    ResponseDispatcher<demo::Todo>::dispatch(
        ok(R"({"id":7,"title":"ship it","done":true})", 201), rec.all());

    std::vector<std::string> expected{"data", "string", "json", "object", "status"};
    EXPECT_EQ(rec.calls, expected);
    EXPECT_EQ(rec.object.id, 7);
    EXPECT_EQ(rec.object.title, "ship it");
    EXPECT_TRUE(rec.object.done);
    EXPECT_EQ(rec.status, 201);
    EXPECT_TRUE(rec.errors.empty());
}

TEST(DispatchTest, DocumentValidButObjectInvalid) {
    Recorder<demo::Todo> rec;
    auto cbs = rec.all();
    cbs.onData = nullptr;
    cbs.onString = nullptr;
    cbs.onStatusCode = nullptr;

    ResponseDispatcher<demo::Todo>::dispatch(ok(R"({"id":"seven"})"), cbs);

    std::vector<std::string> expected{"json", "error"};
    EXPECT_EQ(rec.calls, expected);
    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].kind, ErrorKind::Decode);
    EXPECT_EQ(rec.errors[0].path, "object");
}

TEST(DispatchTest, InvalidDocumentDoesNotBlockSiblings) {
    Recorder<demo::Todo> rec;
    ResponseDispatcher<demo::Todo>::dispatch(ok("not json", 500), rec.all());

    // Both the document and the object consumer fail independently.
    std::vector<std::string> expected{"data", "string", "error", "error", "status"};
    EXPECT_EQ(rec.calls, expected);
    ASSERT_EQ(rec.errors.size(), 2u);
    EXPECT_EQ(rec.errors[0].path, "document");
    EXPECT_EQ(rec.errors[1].path, "object");
    EXPECT_EQ(rec.data, "not json");
    EXPECT_EQ(rec.status, 500);
}

TEST(DispatchTest, InvalidUtf8DegradesToEmptyText) {
    Recorder<std::string> rec;
    auto cbs = rec.all();
    cbs.onJson = nullptr;

    ResponseDispatcher<std::string>::dispatch(ok(std::string("\xFF\xFE\x00", 3)), cbs);

    std::vector<std::string> expected{"data", "string", "object", "status"};
    EXPECT_EQ(rec.calls, expected);
    EXPECT_EQ(rec.text, "");
    EXPECT_EQ(rec.data.size(), 3u);
    EXPECT_EQ(rec.object, rec.data);
    EXPECT_TRUE(rec.errors.empty());
}

TEST(DispatchTest, TransportErrorOnlyReachesErrorConsumer) {
    Recorder<demo::Todo> rec;
    ResponseDispatcher<demo::Todo>::dispatch(
        Result<Response>(Error{ErrorKind::Transport, "connection refused", "http://127.0.0.1:1/"}),
        rec.all());

    std::vector<std::string> expected{"error"};
    EXPECT_EQ(rec.calls, expected);
    EXPECT_EQ(rec.errors[0].kind, ErrorKind::Transport);
}

TEST(DispatchTest, TransportErrorWithoutErrorConsumerIsDropped) {
    Recorder<demo::Todo> rec;
    auto cbs = rec.all();
    cbs.onError = nullptr;

    EXPECT_NO_THROW(ResponseDispatcher<demo::Todo>::dispatch(
        Result<Response>(Error{ErrorKind::Transport, "timeout", "http://e.x/"}), cbs));
    EXPECT_TRUE(rec.calls.empty());
}

TEST(DispatchTest, ThrowingConsumerDoesNotStopOthers) {
    Recorder<std::string> rec;
    auto cbs = rec.all();
    cbs.onData = [](const std::string&){ throw std::runtime_error("consumer bug"); };

    EXPECT_NO_THROW(ResponseDispatcher<std::string>::dispatch(ok("[1,2,3]"), cbs));

    std::vector<std::string> expected{"string", "json", "object", "status"};
    EXPECT_EQ(rec.calls, expected);
}

TEST(DispatchTest, NoConsumersIsANoOp) {
    CallbackSet<std::string> none;
    EXPECT_NO_THROW(ResponseDispatcher<std::string>::dispatch(ok("{}"), none));
}

TEST(DispatchTest, DecodeFailuresAreCounted) {
    auto& reg = util::MetricRegistry::instance();
    const double before = reg.counter("dispatch.decode_failed");

    CallbackSet<demo::Todo> cbs;
    cbs.onJson = [](const rapidjson::Document&){};
    cbs.onObject = [](const demo::Todo&){};
    ResponseDispatcher<demo::Todo>::dispatch(ok("{"), cbs);

    EXPECT_DOUBLE_EQ(reg.counter("dispatch.decode_failed"), before + 2.0);
}

TEST(DispatchTest, CustomDecoderReplacesDefault) {
    CallbackSet<int> cbs;
    int got = 0;
    cbs.decode = [](const std::string& bytes) -> Result<int> {
        return static_cast<int>(bytes.size());
    };
    cbs.onObject = [&got](const int& n){ got = n; };
    ResponseDispatcher<int>::dispatch(ok("abcd"), cbs);
    EXPECT_EQ(got, 4);
}

TEST(DecoderTest, BuiltinsAndVectors) {
    auto n = Decoder<int>::decode("42");
    ASSERT_TRUE(n);
    EXPECT_EQ(*n, 42);

    auto v = Decoder<std::vector<double>>::decode("[1, 2.5, 3]");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->size(), 3u);
    EXPECT_DOUBLE_EQ((*v)[1], 2.5);

    auto todos = Decoder<std::vector<demo::Todo>>::decode(
        R"([{"id":1,"title":"a","done":false},{"id":2,"title":"b","done":true}])");
    ASSERT_TRUE(todos);
    ASSERT_EQ(todos->size(), 2u);
    EXPECT_EQ((*todos)[1].title, "b");

    EXPECT_FALSE(Decoder<int>::decode("\"x\""));
    EXPECT_FALSE(Decoder<std::vector<int>>::decode("[1, \"x\"]"));

    auto raw = Decoder<std::string>::decode("anything at all");
    ASSERT_TRUE(raw);
    EXPECT_EQ(*raw, "anything at all");
}

TEST(DecoderTest, ParseErrorCarriesOffset) {
    auto doc = parseDocument("{\"a\": }");
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().kind, ErrorKind::Decode);
    EXPECT_NE(doc.error().message.find("offset"), std::string::npos);
}
