// Q6.2 — Notifier test
// Payload shape, destination text and channel failures.

#include "qc/notify/Notifier.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static qc::Artifact artifact() {
  qc::Artifact a;
  a.path = "/charts/BTCUSD_1h.png";
  a.ticker = "BTCUSD";
  a.timeframe = "1h";
  return a;
}

int main() {
  // ---- Test 1: payload without destination ----
  {
    qc::ChartRequest req;
    req.ticker = "BTCUSD";
    req.timeframe = "1h";
    req.desc = "Breakout \"confirmed\"";

    const std::string payload = qc::buildNotificationPayload(req, artifact());
    rapidjson::Document d;
    d.Parse(payload.c_str());
    requireTrue(!d.HasParseError() && d.IsArray() && d.Size() == 3, "3-element array");
    requireTrue(std::string(d[0].GetString()) == "ok", "status");
    requireTrue(std::string(d[1].GetString()) == "send_message", "action");

    const auto& body = d[2];
    requireTrue(std::string(body["text"].GetString()) == req.desc, "text escaped + preserved");
    requireTrue(std::string(body["description"].GetString()) == req.desc, "description");
    requireTrue(std::string(body["image_path"].GetString()) == "/charts/BTCUSD_1h.png", "image_path");
    requireTrue(std::string(body["ticker"].GetString()) == "BTCUSD", "ticker");
    requireTrue(std::string(body["timeframe"].GetString()) == "1h", "timeframe");
    requireTrue(body["chat_id"].IsNull(), "chat_id null");
    requireTrue(body["subscriber_list"].IsNull(), "subscriber_list null");
    requireTrue(qc::notificationDestination(req) == "default destination", "default destination");
    std::printf("  Test 1 (payload nulls): PASS\n");
  }

  // ---- Test 2: destinations ----
  {
    qc::ChartRequest req;
    req.hasSubscriberList = true;
    req.subscriberList = "premium";
    requireTrue(qc::notificationDestination(req) == "subscriber_list: premium", "subscriber list");

    req.hasChatId = true;
    req.chatId = -1001234567890LL;
    requireTrue(qc::notificationDestination(req) == "chat_id: -1001234567890", "chat id wins");

    rapidjson::Document d;
    d.Parse(qc::buildNotificationPayload(req, artifact()).c_str());
    requireTrue(d[2]["chat_id"].IsInt64() && d[2]["chat_id"].GetInt64() == -1001234567890LL, "chat_id int64");
    requireTrue(std::string(d[2]["subscriber_list"].GetString()) == "premium", "subscriber_list");
    std::printf("  Test 2 (destinations): PASS\n");
  }

  // ---- Test 3: channel delivery ----
  {
    qc::RecordingChannel ch;
    qc::Notifier n(ch);
    requireTrue(n.route() == "telegram", "default route");

    qc::ChartRequest req;
    req.ticker = "BTCUSD";
    req.timeframe = "1h";
    requireTrue(n.notify(req, artifact()).ok, "notify ok");
    requireTrue(ch.messages().size() == 1, "one message");
    requireTrue(ch.messages()[0].route == "telegram", "route frame");
    requireTrue(ch.messages()[0].payload == qc::buildNotificationPayload(req, artifact()), "payload frame");

    qc::Notifier custom(ch, "alerts");
    requireTrue(custom.notify(req, artifact()).ok, "custom route ok");
    requireTrue(ch.messages().back().route == "alerts", "custom route");
    std::printf("  Test 3 (delivery): PASS\n");
  }

  // ---- Test 4: failure is reported, not retried ----
  {
    qc::RecordingChannel ch;
    qc::Notifier n(ch);
    qc::ChartRequest req;
    ch.failNextSend();
    auto st = n.notify(req, artifact());
    requireTrue(!st.ok && st.err.code == qc::ErrorCode::IoError, "failure propagated");
    requireTrue(ch.messages().empty(), "no retry");
    requireTrue(n.notify(req, artifact()).ok, "next send works");
    requireTrue(ch.messages().size() == 1, "one delivered");
    std::printf("  Test 4 (failure): PASS\n");
  }

  std::printf("Q6.2 notifier: ALL PASS\n");
  return 0;
}
