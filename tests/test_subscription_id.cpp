// =============================================================================
// FILE: tests/test_subscription_id.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "subscription/subscription_id.h"
#include "subscription/subscription_finder.h"
#include "common/bson_tuple.h"
#include "sip/sip_message.h"

using namespace sip_subscription;

namespace {

SipMessage request(const std::string& method, uint32_t cseq, const char* event = nullptr) {
    SipMessage m;
    m.msg_class = SipMessageClass::kRequest;
    m.method = method;
    m.cseq = cseq;
    m.cseq_method = method;
    m.call_id = "call-1";
    if (event) m.event = HeaderTokenizer::tokenize(event).front();
    return m;
}

SipMessage response(int status, const std::string& cseq_method, uint32_t cseq,
                    const char* event = nullptr) {
    SipMessage m;
    m.msg_class = SipMessageClass::kResponse;
    m.status = status;
    m.cseq = cseq;
    m.cseq_method = cseq_method;
    m.call_id = "call-1";
    if (event) m.event = HeaderTokenizer::tokenize(event).front();
    return m;
}

Subscription make_sub(const SubscriptionId& id) {
    Subscription s;
    s.id = id;
    return s;
}

} // namespace

TEST(SubscriptionIdDeriver, ReferRequestAndResponseShareId) {
    auto req = request("REFER", 7);
    auto resp = response(202, "REFER", 7);
    EXPECT_EQ(SubscriptionIdDeriver::derive(req), SubscriptionIdDeriver::derive(resp));
    EXPECT_EQ(SubscriptionIdDeriver::derive(req), SubscriptionIdDeriver::for_refer(7));
}

TEST(SubscriptionIdDeriver, ReferIdDependsOnCseq) {
    EXPECT_NE(SubscriptionIdDeriver::derive(request("REFER", 7)),
              SubscriptionIdDeriver::derive(request("REFER", 8)));
}

TEST(SubscriptionIdDeriver, ReferIgnoresEventHeader) {
    EXPECT_EQ(SubscriptionIdDeriver::derive(request("REFER", 3, "dialog;id=9")),
              SubscriptionIdDeriver::for_refer(3));
}

TEST(SubscriptionIdDeriver, NotifyForReferMatchesRefer) {
    auto notify = request("NOTIFY", 101, "refer;id=7");
    EXPECT_EQ(SubscriptionIdDeriver::derive(notify), SubscriptionIdDeriver::for_refer(7));
}

TEST(SubscriptionIdDeriver, ReferCseqOnOtherRequestIsNotRefer) {
    SipMessage m = request("NOTIFY", 7);
    m.cseq_method = "REFER";
    EXPECT_EQ(SubscriptionIdDeriver::derive(m), SubscriptionIdDeriver::kNoEventId);
}

TEST(SubscriptionIdDeriver, EventWithId) {
    auto m = request("SUBSCRIBE", 1, "dialog;id=abcd");
    EXPECT_EQ(SubscriptionIdDeriver::derive(m),
              BsonTuple::digest({std::string("dialog"), std::string("abcd")}));
}

TEST(SubscriptionIdDeriver, EventWithoutIdUsesNull) {
    auto m = request("SUBSCRIBE", 1, "presence");
    EXPECT_EQ(SubscriptionIdDeriver::derive(m),
              BsonTuple::digest({std::string("presence"), std::nullopt}));
    EXPECT_NE(SubscriptionIdDeriver::derive(m),
              SubscriptionIdDeriver::derive(request("SUBSCRIBE", 1, "presence;id=")));
}

TEST(SubscriptionIdDeriver, SameEventSameIdAcrossMethods) {
    auto subscribe = request("SUBSCRIBE", 1, "dialog;id=1");
    auto notify = request("NOTIFY", 55, "Dialog;id=1;other=x");
    auto ok = response(200, "SUBSCRIBE", 1, "dialog;id=1");
    EXPECT_EQ(SubscriptionIdDeriver::derive(subscribe), SubscriptionIdDeriver::derive(notify));
    EXPECT_EQ(SubscriptionIdDeriver::derive(subscribe), SubscriptionIdDeriver::derive(ok));
}

TEST(SubscriptionIdDeriver, DifferentIdParamDifferentSubscription) {
    EXPECT_NE(SubscriptionIdDeriver::derive(request("SUBSCRIBE", 1, "dialog;id=1")),
              SubscriptionIdDeriver::derive(request("SUBSCRIBE", 1, "dialog;id=2")));
}

TEST(SubscriptionIdDeriver, NoEventHeaderGivesSentinel) {
    EXPECT_EQ(SubscriptionIdDeriver::derive(request("SUBSCRIBE", 1)), "id");
    EXPECT_EQ(SubscriptionIdDeriver::derive(response(489, "SUBSCRIBE", 1)), "id");
}

TEST(SubscriptionFinder, FindsById) {
    Dialog d;
    d.subscriptions = {make_sub("a"), make_sub("b"), make_sub("c")};
    const Dialog& cd = d;
    const Subscription* s = SubscriptionFinder::find("b", cd);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s, &d.subscriptions[1]);
}

TEST(SubscriptionFinder, MissingIsNull) {
    Dialog d;
    EXPECT_EQ(SubscriptionFinder::find("a", d), nullptr);
    d.subscriptions = {make_sub("a")};
    EXPECT_EQ(SubscriptionFinder::find("A", d), nullptr);
}

TEST(SubscriptionFinder, FindsByMessage) {
    auto subscribe = request("SUBSCRIBE", 1, "dialog;id=1");
    Dialog d;
    d.subscriptions = {make_sub("other"), make_sub(SubscriptionIdDeriver::derive(subscribe))};

    Subscription* s = SubscriptionFinder::find(request("NOTIFY", 2, "dialog;id=1"), d);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s, &d.subscriptions[1]);
    EXPECT_EQ(SubscriptionFinder::find(request("NOTIFY", 2, "dialog;id=2"), d), nullptr);
}

TEST(SubscriptionFinder, DoesNotModifyDialog) {
    Dialog d;
    d.subscriptions = {make_sub("a"), make_sub("b")};
    SubscriptionFinder::find("zzz", d);
    SubscriptionFinder::find("a", d);
    ASSERT_EQ(d.subscriptions.size(), 2u);
    EXPECT_EQ(d.subscriptions[0].id, "a");
    EXPECT_EQ(d.subscriptions[1].id, "b");
}
