#include "../test_runner.h"
#include "core/logger.h"
#include "sync/remote_source.h"
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {
// Scripted transport. Responses are served in queue order and every request
// is recorded for inspection.
class ScriptedTransport : public IHttpTransport {
public:
  struct Request {
    std::string target;
    json body;
    std::map<std::string, std::string> headers;
  };

  void queueBody(const std::string &body,
                 std::map<std::string, std::string> headers = {}) {
    HTTPResponse response;
    response.status_code = 200;
    response.body = body;
    response.headers = std::move(headers);
    responses_.push_back(response);
  }

  void queueFailure(const std::string &message) {
    HTTPResponse response;
    response.error_message = message;
    responses_.push_back(response);
  }

  HTTPResponse postJson(const std::string &endpoint,
                        const json &body) override {
    requests.push_back({endpoint, body, {}});
    return next();
  }

  HTTPResponse get(const std::string &url,
                   const std::map<std::string, std::string> &headers) override {
    requests.push_back({url, json(), headers});
    return next();
  }

  std::vector<Request> requests;

private:
  std::deque<HTTPResponse> responses_;

  HTTPResponse next() {
    if (responses_.empty()) {
      HTTPResponse response;
      response.error_message = "no scripted response";
      return response;
    }
    HTTPResponse response = responses_.front();
    responses_.pop_front();
    return response;
  }
};

ClientMetadata testMetadata() {
  ClientMetadata metadata;
  metadata.sessionId = "session-1";
  return metadata;
}

template <typename Call>
bool throwsKind(Call call, RemoteSourceError::Kind kind) {
  try {
    call();
  } catch (const RemoteSourceError &e) {
    return e.kind() == kind;
  }
  return false;
}
} // namespace

int main() {
  Logger::initialize();
  Logger::setLogLevel(LogLevel::CRITICAL);
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "REMOTE SOURCE TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Snapshot request carries sinceTime and metadata", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->queueBody(
        R"({"has_updates": true, "time": 42,
            "feature_gates": [{"name": "g1", "type": "feature_gate", "enabled": true}]})");
    HttpRemoteSource source(transport, testMetadata());

    SyncSnapshot snapshot = source.fetchConfigSnapshot(17);
    runner.assertTrue(snapshot.hasUpdates, "Has updates");
    runner.assertEquals(static_cast<int64_t>(42), snapshot.time, "Time");
    runner.assertEquals(static_cast<size_t>(1), snapshot.featureGates.size(),
                        "One gate");

    runner.assertEquals(static_cast<size_t>(1), transport->requests.size(),
                        "One request");
    const auto &request = transport->requests[0];
    runner.assertEquals(std::string("/download_config_specs"), request.target,
                        "Endpoint");
    runner.assertEquals(static_cast<int64_t>(17),
                        request.body["sinceTime"].get<int64_t>(),
                        "sinceTime sent");
    runner.assertEquals(std::string("session-1"),
                        request.body["sdkMetadata"]["sessionID"]
                            .get<std::string>(),
                        "Session id sent");
  });

  runner.runTest("Snapshot decode failures", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    HttpRemoteSource source(transport, testMetadata());

    transport->queueBody("{ not json");
    runner.assertTrue(throwsKind([&]() { source.fetchConfigSnapshot(0); },
                                 RemoteSourceError::Kind::DECODE),
                      "Malformed JSON is DECODE");

    transport->queueBody("[1, 2, 3]");
    runner.assertTrue(throwsKind([&]() { source.fetchConfigSnapshot(0); },
                                 RemoteSourceError::Kind::DECODE),
                      "Array payload is DECODE");

    transport->queueFailure("connection refused");
    runner.assertTrue(throwsKind([&]() { source.fetchConfigSnapshot(0); },
                                 RemoteSourceError::Kind::TRANSPORT),
                      "Transport error is TRANSPORT");
  });

  runner.runTest("Catalog decodes entries and fills names from keys", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->queueBody(
        R"({"beta": {"size": 12, "creationTime": 100,
                     "url": "https://cdn.example/beta", "fileID": "f1"},
            "named": {"name": "named", "size": 3}})");
    HttpRemoteSource source(transport, testMetadata());

    IDListCatalog catalog = source.fetchIDListCatalog();
    runner.assertEquals(static_cast<size_t>(2), catalog.size(), "Two lists");
    runner.assertEquals(std::string("beta"), catalog["beta"].name,
                        "Name filled from key");
    runner.assertEquals(static_cast<int64_t>(12), catalog["beta"].size,
                        "Size decoded");
    runner.assertEquals(std::string("https://cdn.example/beta"),
                        catalog["beta"].url, "URL decoded");
    runner.assertEquals(std::string("f1"), catalog["beta"].fileID,
                        "File id decoded");
    runner.assertEquals(std::string("named"), catalog["named"].name,
                        "Explicit name kept");

    runner.assertEquals(std::string("/get_id_lists"),
                        transport->requests[0].target, "Endpoint");
    runner.assertTrue(transport->requests[0].body.contains("sdkMetadata"),
                      "Metadata sent");
  });

  runner.runTest("Empty catalog object is valid", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->queueBody("{}");
    HttpRemoteSource source(transport, testMetadata());
    runner.assertTrue(source.fetchIDListCatalog().empty(), "No lists");
  });

  runner.runTest("Catalog payloads that are not objects fail to decode", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    HttpRemoteSource source(transport, testMetadata());

    transport->queueBody("[]");
    runner.assertTrue(throwsKind([&]() { source.fetchIDListCatalog(); },
                                 RemoteSourceError::Kind::DECODE),
                      "Array is DECODE");

    transport->queueBody("null");
    runner.assertTrue(throwsKind([&]() { source.fetchIDListCatalog(); },
                                 RemoteSourceError::Kind::DECODE),
                      "null is DECODE");

    transport->queueBody(R"({"beta": {"size": "big"}})");
    runner.assertTrue(throwsKind([&]() { source.fetchIDListCatalog(); },
                                 RemoteSourceError::Kind::DECODE),
                      "Wrong-typed entry is DECODE");

    transport->queueFailure("timeout");
    runner.assertTrue(throwsKind([&]() { source.fetchIDListCatalog(); },
                                 RemoteSourceError::Kind::TRANSPORT),
                      "Transport error is TRANSPORT");
  });

  runner.runTest("Range fetch sends the byte offset", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->queueBody("+u1\n", {{"content-length", "4"}});
    HttpRemoteSource source(transport, testMetadata());

    RangeResponse response = source.fetchRange("https://cdn.example/beta", 12);
    runner.assertEquals(std::string("+u1\n"), response.content, "Body");
    runner.assertEquals(static_cast<int64_t>(4), response.contentLength,
                        "Content length");

    const auto &request = transport->requests[0];
    runner.assertEquals(std::string("https://cdn.example/beta"),
                        request.target, "Absolute URL");
    runner.assertEquals(std::string("bytes=12-"), request.headers.at("Range"),
                        "Range header");
  });

  runner.runTest("Missing or garbage content-length is -1", [&]() {
    auto transport = std::make_shared<ScriptedTransport>();
    HttpRemoteSource source(transport, testMetadata());

    transport->queueBody("+a\n");
    runner.assertEquals(static_cast<int64_t>(-1),
                        source.fetchRange("https://cdn.example/a", 0)
                            .contentLength,
                        "Missing header");

    transport->queueBody("+a\n", {{"content-length", "lots"}});
    runner.assertEquals(static_cast<int64_t>(-1),
                        source.fetchRange("https://cdn.example/a", 0)
                            .contentLength,
                        "Garbage header");

    transport->queueFailure("404");
    runner.assertTrue(
        throwsKind([&]() { source.fetchRange("https://cdn.example/a", 0); },
                   RemoteSourceError::Kind::TRANSPORT),
        "Failed GET is TRANSPORT");
  });

  runner.runTest("Header lines are lower-cased and trimmed", [&]() {
    std::map<std::string, std::string> headers;
    HttpTransport::collectHeaderLine("Content-Length:  42 \r\n", headers);
    HttpTransport::collectHeaderLine("X-Custom-Header:value\r\n", headers);
    HttpTransport::collectHeaderLine("\r\n", headers);

    runner.assertEquals(static_cast<size_t>(2), headers.size(), "Two headers");
    runner.assertEquals(std::string("42"), headers["content-length"],
                        "Value trimmed");
    runner.assertEquals(std::string("value"), headers["x-custom-header"],
                        "Name lower-cased");

    HTTPResponse response;
    response.headers = headers;
    runner.assertEquals(std::string("42"), response.header("CONTENT-LENGTH"),
                        "Lookup ignores case");
    runner.assertEquals(std::string(""), response.header("etag"),
                        "Absent header is empty");
  });

  runner.runTest("Status line starts a new header set", [&]() {
    std::map<std::string, std::string> headers;
    HttpTransport::collectHeaderLine("HTTP/1.1 301 Moved Permanently\r\n",
                                     headers);
    HttpTransport::collectHeaderLine("Location: https://cdn.example/b\r\n",
                                     headers);
    HttpTransport::collectHeaderLine("HTTP/1.1 206 Partial Content\r\n",
                                     headers);
    HttpTransport::collectHeaderLine("Content-Length: 7\r\n", headers);

    runner.assertEquals(static_cast<size_t>(1), headers.size(),
                        "Redirect headers dropped");
    runner.assertEquals(std::string("7"), headers["content-length"],
                        "Final response headers kept");
  });

  runner.printSummary();
  return 0;
}
